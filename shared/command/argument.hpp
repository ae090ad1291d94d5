#pragma once

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "result.h"
#include "message.hpp"
#include "parse_error.hpp"

namespace command {

using Converter = std::function<Result<std::any>(const std::string&)>;
using Validator = std::function<bool(const std::any&)>;

// Built-in converter for String/Int/Float/Bool, nullptr for Custom.
//   Bool:  y/yes/true/t/1 and n/no/false/f/0, case insensitive
//   Float: a trailing '%' divides by 100
const Converter* builtinConverter(message::ArgType type);

// Wraps a typed predicate as a Validator; a value of another type fails.
template <typename T, typename F>
Validator validateAs(F predicate) {
    return [predicate](const std::any& value) {
        const T* typed = std::any_cast<T>(&value);
        return typed != nullptr && predicate(*typed);
    };
}

struct ArgumentDescriptor {
    std::vector<std::string> names;     // names[0] is canonical
    std::string description;
    std::string example;
    message::ArgType type = message::ArgType::String;
    std::string type_name;              // shown in help for Custom types
    Converter converter;                // required for Custom
    Validator validator;
    bool flag = false;
    bool optional = false;
    std::any default_value;
};

/**
 * Schema of one command argument. Immutable once created.
 *
 * A flag is a Bool argument that is optional, defaults to false and
 * never takes a value from the following token.
 */
class Argument {
public:
    Argument() = default;

    static Result<Argument> create(ArgumentDescriptor desc);
    static Result<Argument> flag(std::vector<std::string> names, std::string description);
    // Restricts the value to allowed_values, each converted with the descriptor's converter.
    static Result<Argument> selection(ArgumentDescriptor desc, std::vector<std::string> allowed_values);

    const std::string& name() const { return names_.front(); }
    const std::vector<std::string>& names() const { return names_; }
    const std::string& description() const { return description_; }
    const std::string& example() const { return example_; }
    message::ArgType type() const { return type_; }
    std::string typeName() const;
    bool isFlag() const { return flag_; }
    bool isOptional() const { return optional_; }
    const std::any& defaultValue() const { return default_; }
    const std::vector<std::string>& allowedValues() const { return allowed_values_; }

    bool hasName(const std::string& alias) const;

    // Converts then validates raw. Without a value: the default when optional,
    // MissingRequiredArgument otherwise.
    ParseResult<std::any> parse(const std::optional<std::string>& raw) const;

private:
    std::vector<std::string> names_;
    std::string description_;
    std::string example_;
    message::ArgType type_ = message::ArgType::String;
    std::string type_name_;
    Converter converter_;
    Validator validator_;
    bool flag_ = false;
    bool optional_ = false;
    std::any default_;
    std::vector<std::string> allowed_values_;
};

// Checks one command's argument list: no alias declared twice,
// no required argument after an optional one (flags are not positional and are skipped).
Result<void> validateArguments(const std::vector<Argument>& arguments);

// Equality for values produced by the built-in converters; false for anything else.
bool valueEquals(const std::any& lhs, const std::any& rhs);

} // namespace command
