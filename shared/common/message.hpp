#pragma once

#include <unordered_map>
#include <any>
#include <string>


namespace message {

// One command invocation: topic is the canonical command name,
// values holds one entry per declared argument (canonical name -> value).
struct Message {
    std::string topic;
    std::unordered_map<std::string, std::any> values;
};

// String -> std::string, Int -> int64_t, Float -> double, Bool -> bool
enum class ArgType {
    String,
    Int,
    Float,
    Bool,
    Custom
};

inline const char* to_string(ArgType type) {
    switch (type) {
        case ArgType::String: return "str";
        case ArgType::Int:    return "int";
        case ArgType::Float:  return "float";
        case ArgType::Bool:   return "bool";
        default:              return "custom";
    }
}

}
