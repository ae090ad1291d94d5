#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "caller_context.hpp"

namespace manifest {

struct BotInfo {
    std::string name;           // answers to "/cmd@<name>"
    std::string description;
};

struct ErrorHandlingInfo {
    bool silent_denial = true;  // no reply on permission denial
    bool print_error = false;   // show handler errors to the user
};

// Who is typing on the console.
struct ConsoleInfo {
    std::string username = "guest";             // sender when a line has no "@user:" prefix
    std::map<std::string, int64_t> users;       // username -> user id, unknown users get 0
    int64_t chat_id = 1;
    chat::ChatType chat_type = chat::ChatType::Private;
    std::vector<std::string> admins;    // usernames reported as chat administrators
    std::string creator;                // username reported as chat creator
};

struct BotManifest {
    BotInfo bot;
    std::string logging;        // logging configuration path
    std::string commands;       // command manifest path
    ErrorHandlingInfo error_handling;
    ConsoleInfo console;
};

} // namespace manifest
