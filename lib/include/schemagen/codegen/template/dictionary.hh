//
// Template Dictionary - the data model consumed by fragments
//
// A dictionary maps keys to strongly typed values: scalar strings, booleans,
// nested dictionaries, ordered sequences of dictionaries, and compiled
// fragments (used as partials). Dictionaries are built by model transforms
// and are not modified once handed to a fragment.
//

#pragma once

#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace schemagen::codegen {

class Dictionary;
class Fragment;

using DictionaryList = std::vector<Dictionary>;
using FragmentPtr = std::shared_ptr<const Fragment>;

// ============================================================================
// Value - one entry of a dictionary
// ============================================================================

class Value {
public:
    enum class Kind {
        String,
        Boolean,
        Dictionary,
        List,
        Partial
    };

    Value(std::string text);
    Value(const char* text);
    Value(bool flag);
    Value(Dictionary nested);
    Value(DictionaryList items);
    Value(FragmentPtr partial);

    // Numbers must be rendered to text by the transform, never converted to bool
    template<typename T, std::enable_if_t<
        std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T) = delete;

    [[nodiscard]] Kind kind() const;

    /// Human readable kind, used in error messages
    [[nodiscard]] const char* kind_name() const;

    // Typed accessors; nullptr when the value holds another kind
    [[nodiscard]] const std::string* as_string() const;
    [[nodiscard]] const bool* as_bool() const;
    [[nodiscard]] const Dictionary* as_dictionary() const;
    [[nodiscard]] const DictionaryList* as_list() const;
    [[nodiscard]] const Fragment* as_partial() const;

private:
    // Nested shapes are shared; a Value is cheap to copy
    std::variant<
        std::string,
        bool,
        std::shared_ptr<const Dictionary>,
        std::shared_ptr<const DictionaryList>,
        FragmentPtr
    > data_;
};

// ============================================================================
// Dictionary
// ============================================================================

class Dictionary {
public:
    Dictionary() = default;
    Dictionary(std::initializer_list<std::pair<const std::string, Value>> entries);

    /// Add or replace an entry; returns *this for chaining while building
    Dictionary& set(const std::string& key, Value value);

    /// Look up a key in this dictionary only (no scope fallback)
    [[nodiscard]] const Value* find(const std::string& key) const;

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    [[nodiscard]] const std::map<std::string, Value>& entries() const { return entries_; }

private:
    std::map<std::string, Value> entries_;
};

}  // namespace schemagen::codegen
