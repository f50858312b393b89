//
// Code Generation Errors
//

#pragma once

#include <stdexcept>
#include <string>

namespace schemagen::codegen {

// ============================================================================
// Code Generation Exceptions
// ============================================================================

/**
 * Base exception for code generation errors.
 *
 * Every error raised while generating code is a programmer-visible defect:
 * generation of the offending document is aborted, nothing is retried.
 */
class codegen_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Exception thrown when a type or constant reaches a mapping function that
 * has no case for it.
 *
 * The schema passed validation, so this indicates a bug in either:
 * - the generator's case tables (incomplete mapping)
 * - the caller (e.g. asking for a read method of a struct type)
 */
class internal_error : public codegen_error {
public:
    internal_error(const std::string& function, const std::string& what_arg)
        : codegen_error("Internal error in " + function + ": " + what_arg),
          function_(function) {}

    [[nodiscard]] const std::string& function() const { return function_; }

private:
    std::string function_;
};

/**
 * Exception thrown when a dictionary and a fragment disagree.
 *
 * Raised for keys the fragment references but the dictionary lacks, for
 * values of the wrong shape, and for malformed fragment text.
 */
class template_error : public codegen_error {
public:
    template_error(const std::string& fragment_name,
                   const std::string& key,
                   const std::string& message)
        : codegen_error(build_message(fragment_name, key, message)),
          fragment_name_(fragment_name),
          key_(key) {}

    [[nodiscard]] const std::string& fragment_name() const { return fragment_name_; }
    [[nodiscard]] const std::string& key() const { return key_; }

private:
    std::string fragment_name_;
    std::string key_;

    static std::string build_message(const std::string& fragment_name,
                                     const std::string& key,
                                     const std::string& message) {
        std::string result = "template '" + fragment_name + "'";
        if (!key.empty()) {
            result += ", key '" + key + "'";
        }
        return result + ": " + message;
    }
};

/**
 * Exception thrown when a fragment loader or registry has no fragment
 * under the requested name.
 */
class fragment_not_found_error : public template_error {
public:
    explicit fragment_not_found_error(const std::string& fragment_name)
        : template_error(fragment_name, "", "fragment not found") {}
};

} // namespace schemagen::codegen
