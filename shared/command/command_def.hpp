#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "result.h"
#include "message.hpp"
#include "caller_context.hpp"
#include "permission.hpp"
#include "argument.hpp"
#include "command_target.hpp"

namespace command {

class ErrorHandler;

// message.topic is the canonical command name, message.values the resolved arguments.
using Handler = std::function<Result<void>(const chat::CallerContext&, const message::Message&)>;
using HiddenPredicate = std::function<bool(const chat::CallerContext&)>;

struct CommandInfo {
    std::vector<std::string> names;                     // names[0] is canonical, no leading '/'
    std::string description;
    std::vector<Argument> arguments;
    std::optional<permission::Permission> permissions;  // unset: everybody
    CommandTarget allowed_targets = DEFAULT_COMMAND_TARGET;
    HiddenPredicate hidden;                             // unset: listed
    Handler handler;
    std::shared_ptr<ErrorHandler> error_handler;        // consulted before the default one

    const std::string& name() const { return names.front(); }
};

} // namespace command
