#include "argument.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <unordered_map>

#include <fmt/format.h>

namespace command {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Result<std::any> conversionError(std::string reason) {
    return Result<std::any>::Error(ResultCode::InvalidArgumentValue, std::move(reason));
}

Result<std::any> convertString(const std::string& raw) {
    return Result<std::any>::OK(std::any(raw));
}

Result<std::any> convertBool(const std::string& raw) {
    static const char* const truthy[] = { "y", "yes", "true", "t", "1" };
    static const char* const falsy[]  = { "n", "no", "false", "f", "0" };

    const auto value = toLower(trim(raw));
    for (const char* t : truthy) {
        if (value == t) return Result<std::any>::OK(std::any(true));
    }
    for (const char* f : falsy) {
        if (value == f) return Result<std::any>::OK(std::any(false));
    }
    return conversionError(fmt::format("'{}' is not a boolean", raw));
}

Result<std::any> convertInt(const std::string& raw) {
    const auto value = trim(raw);
    if (value.empty()) return conversionError("expected an integer");

    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (end != value.c_str() + value.size()) {
        return conversionError(fmt::format("'{}' is not an integer", raw));
    }
    if (errno == ERANGE) {
        return conversionError(fmt::format("'{}' is out of range", raw));
    }
    return Result<std::any>::OK(std::any(static_cast<int64_t>(parsed)));
}

Result<std::any> convertFloat(const std::string& raw) {
    auto value = trim(raw);
    double scale = 1.0;
    if (!value.empty() && value.back() == '%') {
        value.pop_back();
        scale = 100.0;
    }
    if (value.empty()) return conversionError("expected a number");
    // decimal only, strtod would also take hex floats
    if (value.find_first_of("xX") != std::string::npos) {
        return conversionError(fmt::format("'{}' is not a number", raw));
    }

    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size()) {
        return conversionError(fmt::format("'{}' is not a number", raw));
    }
    if (errno == ERANGE) {
        return conversionError(fmt::format("'{}' is out of range", raw));
    }
    return Result<std::any>::OK(std::any(parsed / scale));
}

bool isValidAlias(const std::string& alias) {
    if (alias.empty()) return false;
    return std::none_of(alias.begin(), alias.end(), [](unsigned char c) {
        return std::isspace(c) || c == '=';
    });
}

} // namespace

const Converter* builtinConverter(message::ArgType type) {
    static const std::unordered_map<message::ArgType, Converter> table = {
        { message::ArgType::String, convertString },
        { message::ArgType::Int,    convertInt },
        { message::ArgType::Float,  convertFloat },
        { message::ArgType::Bool,   convertBool },
    };
    auto it = table.find(type);
    return it == table.end() ? nullptr : &it->second;
}

Result<Argument> Argument::create(ArgumentDescriptor desc) {
    if (desc.names.empty()) {
        return Result<Argument>::Error(ResultCode::InvalidArgument, "an argument needs at least one name");
    }
    for (size_t i = 0; i < desc.names.size(); ++i) {
        const auto& alias = desc.names[i];
        if (!isValidAlias(alias)) {
            return Result<Argument>::Error(ResultCode::InvalidArgument,
                fmt::format("invalid argument name '{}'", alias));
        }
        if (std::find(desc.names.begin(), desc.names.begin() + i, alias) != desc.names.begin() + i) {
            return Result<Argument>::Error(ResultCode::DuplicateArgumentAlias,
                fmt::format("argument '{}' declares alias '{}' twice", desc.names.front(), alias));
        }
    }

    Argument arg;
    arg.names_ = std::move(desc.names);
    arg.description_ = std::move(desc.description);
    arg.example_ = std::move(desc.example);
    arg.type_name_ = std::move(desc.type_name);
    arg.validator_ = std::move(desc.validator);

    if (desc.flag) {
        arg.flag_ = true;
        arg.type_ = message::ArgType::Bool;
        arg.optional_ = true;
        arg.default_ = false;
        arg.converter_ = *builtinConverter(message::ArgType::Bool);
        if (arg.example_.empty()) {
            arg.example_ = (arg.name().size() > 1 ? "--" : "-") + arg.name();
        }
        return Result<Argument>::OK(std::move(arg));
    }

    arg.type_ = desc.type;
    arg.optional_ = desc.optional;
    arg.default_ = std::move(desc.default_value);
    if (desc.converter) {
        arg.converter_ = std::move(desc.converter);
    } else if (const Converter* builtin = builtinConverter(desc.type)) {
        arg.converter_ = *builtin;
    } else {
        return Result<Argument>::Error(ResultCode::InvalidArgument,
            fmt::format("argument '{}' has a custom type but no converter", arg.name()));
    }
    return Result<Argument>::OK(std::move(arg));
}

Result<Argument> Argument::flag(std::vector<std::string> names, std::string description) {
    ArgumentDescriptor desc;
    desc.names = std::move(names);
    desc.description = std::move(description);
    desc.flag = true;
    return create(std::move(desc));
}

Result<Argument> Argument::selection(ArgumentDescriptor desc, std::vector<std::string> allowed_values) {
    if (allowed_values.empty()) {
        return Result<Argument>::Error(ResultCode::InvalidArgument, "a selection needs at least one allowed value");
    }
    if (desc.flag) {
        return Result<Argument>::Error(ResultCode::InvalidArgument, "a flag cannot be a selection");
    }
    if (desc.example.empty()) desc.example = allowed_values.front();

    auto created = create(std::move(desc));
    if (!created) return created;
    Argument arg = std::move(created.value());

    std::vector<std::any> allowed;
    allowed.reserve(allowed_values.size());
    for (const auto& raw : allowed_values) {
        auto converted = arg.converter_(raw);
        if (!converted) {
            return Result<Argument>::Error(ResultCode::InvalidArgument,
                fmt::format("allowed value '{}' of argument '{}' does not convert: {}",
                            raw, arg.name(), converted.error().value_or("conversion failed")));
        }
        allowed.push_back(converted.value());
    }

    Validator extra = std::move(arg.validator_);
    arg.validator_ = [allowed, extra](const std::any& value) {
        bool member = std::any_of(allowed.begin(), allowed.end(),
            [&value](const std::any& candidate) { return valueEquals(candidate, value); });
        return member && (!extra || extra(value));
    };
    arg.allowed_values_ = std::move(allowed_values);
    return Result<Argument>::OK(std::move(arg));
}

std::string Argument::typeName() const {
    if (flag_) return "flag";
    if (!type_name_.empty()) return type_name_;
    return message::to_string(type_);
}

bool Argument::hasName(const std::string& alias) const {
    return std::find(names_.begin(), names_.end(), alias) != names_.end();
}

ParseResult<std::any> Argument::parse(const std::optional<std::string>& raw) const {
    if (!raw) {
        if (optional_) return ParseResult<std::any>::OK(default_);
        return parseFailure<std::any>(ResultCode::MissingRequiredArgument, name(), "",
            fmt::format("Missing value for argument: {}", name()));
    }

    auto converted = converter_(*raw);
    if (!converted) {
        return parseFailure<std::any>(ResultCode::InvalidArgumentValue, name(), *raw,
            fmt::format("Invalid value '{}' for argument '{}': {}",
                        *raw, name(), converted.error().value_or("conversion failed")));
    }
    if (validator_ && !validator_(converted.value())) {
        return parseFailure<std::any>(ResultCode::InvalidArgumentValue, name(), *raw,
            fmt::format("Invalid argument value: {}", *raw));
    }
    return ParseResult<std::any>::OK(std::move(converted.value()));
}

Result<void> validateArguments(const std::vector<Argument>& arguments) {
    std::unordered_map<std::string, size_t> owners;
    for (size_t i = 0; i < arguments.size(); ++i) {
        const auto& arg = arguments[i];
        if (arg.names().empty()) {
            return Error(ResultCode::InvalidArgument, fmt::format("argument #{} has no name", i));
        }
        for (const auto& alias : arg.names()) {
            auto [it, inserted] = owners.emplace(alias, i);
            if (!inserted) {
                return Error(ResultCode::DuplicateArgumentAlias,
                    fmt::format("alias '{}' is declared by both '{}' and '{}'",
                                alias, arguments[it->second].name(), arg.name()));
            }
        }
    }

    const Argument* first_optional = nullptr;
    for (const auto& arg : arguments) {
        if (arg.isFlag()) continue;
        if (arg.isOptional()) {
            if (!first_optional) first_optional = &arg;
        } else if (first_optional) {
            return Error(ResultCode::AliasOrderViolation,
                fmt::format("required argument '{}' follows optional argument '{}'",
                            arg.name(), first_optional->name()));
        }
    }
    return OK();
}

bool valueEquals(const std::any& lhs, const std::any& rhs) {
    if (lhs.type() != rhs.type()) return false;
    if (auto l = std::any_cast<std::string>(&lhs)) return *l == *std::any_cast<std::string>(&rhs);
    if (auto l = std::any_cast<int64_t>(&lhs))     return *l == *std::any_cast<int64_t>(&rhs);
    if (auto l = std::any_cast<double>(&lhs))      return *l == *std::any_cast<double>(&rhs);
    if (auto l = std::any_cast<bool>(&lhs))        return *l == *std::any_cast<bool>(&rhs);
    return false;
}

} // namespace command
