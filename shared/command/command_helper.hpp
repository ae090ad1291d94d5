#pragma once
#include <any>
#include <cstdint>
#include <string>

#include <fmt/format.h>

#include "message.hpp"

namespace command {

class CommandHelper {
public:
    template<typename T>
    static T get(const message::Message& args, const std::string& key) {
        return std::any_cast<T>(args.values.at(key));
    }

    // defaultValue also when the entry holds no value (optional argument without default)
    template<typename T>
    static T getOr(const message::Message& args, const std::string& key, const T& defaultValue) {
        auto it = args.values.find(key);
        if (it == args.values.end() || !it->second.has_value()) return defaultValue;
        const T* value = std::any_cast<T>(&it->second);
        return value ? *value : defaultValue;
    }

    static bool has(const message::Message& args, const std::string& key) {
        auto it = args.values.find(key);
        return it != args.values.end() && it->second.has_value();
    }

    // Text form of a built-in value, "" for an empty one.
    static std::string toString(const std::any& value) {
        if (!value.has_value()) return "";
        if (auto v = std::any_cast<std::string>(&value)) return *v;
        if (auto v = std::any_cast<int64_t>(&value))     return std::to_string(*v);
        if (auto v = std::any_cast<double>(&value))      return fmt::format("{}", *v);
        if (auto v = std::any_cast<bool>(&value))        return *v ? "true" : "false";
        return "<" + std::string(value.type().name()) + ">";
    }
};

} // namespace command
