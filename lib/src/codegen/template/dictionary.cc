#include <schemagen/codegen/template/dictionary.hh>
#include <schemagen/codegen/template/fragment.hh>

namespace schemagen::codegen {

// ============================================================================
// Value
// ============================================================================

Value::Value(std::string text)
    : data_(std::move(text))
{
}

Value::Value(const char* text)
    : data_(std::string(text ? text : ""))
{
}

Value::Value(bool flag)
    : data_(flag)
{
}

Value::Value(Dictionary nested)
    : data_(std::make_shared<const Dictionary>(std::move(nested)))
{
}

Value::Value(DictionaryList items)
    : data_(std::make_shared<const DictionaryList>(std::move(items)))
{
}

Value::Value(FragmentPtr partial)
    : data_(std::move(partial))
{
}

Value::Kind Value::kind() const {
    switch (data_.index()) {
        case 0: return Kind::String;
        case 1: return Kind::Boolean;
        case 2: return Kind::Dictionary;
        case 3: return Kind::List;
        default: return Kind::Partial;
    }
}

const char* Value::kind_name() const {
    switch (kind()) {
        case Kind::String: return "string";
        case Kind::Boolean: return "boolean";
        case Kind::Dictionary: return "dictionary";
        case Kind::List: return "list";
        case Kind::Partial: return "partial";
    }
    return "unknown";
}

const std::string* Value::as_string() const {
    return std::get_if<std::string>(&data_);
}

const bool* Value::as_bool() const {
    return std::get_if<bool>(&data_);
}

const Dictionary* Value::as_dictionary() const {
    auto* ptr = std::get_if<std::shared_ptr<const Dictionary>>(&data_);
    return ptr ? ptr->get() : nullptr;
}

const DictionaryList* Value::as_list() const {
    auto* ptr = std::get_if<std::shared_ptr<const DictionaryList>>(&data_);
    return ptr ? ptr->get() : nullptr;
}

const Fragment* Value::as_partial() const {
    auto* ptr = std::get_if<FragmentPtr>(&data_);
    return ptr ? ptr->get() : nullptr;
}

// ============================================================================
// Dictionary
// ============================================================================

Dictionary::Dictionary(std::initializer_list<std::pair<const std::string, Value>> entries)
    : entries_(entries)
{
}

Dictionary& Dictionary::set(const std::string& key, Value value) {
    entries_.insert_or_assign(key, std::move(value));
    return *this;
}

const Value* Dictionary::find(const std::string& key) const {
    auto it = entries_.find(key);
    return it != entries_.end() ? &it->second : nullptr;
}

}  // namespace schemagen::codegen
