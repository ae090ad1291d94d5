#include "command_dispatcher.hpp"

#include <exception>
#include <optional>

#include <fmt/format.h>

#include "argument_parser.hpp"
#include "command_help.hpp"
#include "command_target.hpp"
#include "logging.hpp"

namespace command {

const char* to_string(DispatchState state) {
    switch (state) {
        case DispatchState::Received:          return "Received";
        case DispatchState::TargetFiltered:    return "TargetFiltered";
        case DispatchState::PermissionChecked: return "PermissionChecked";
        case DispatchState::Parsed:            return "Parsed";
        case DispatchState::Invoked:           return "Invoked";
        case DispatchState::Ignored:           return "Ignored";
    }
    return "Unknown";
}

CommandDispatcher::CommandDispatcher(const CommandRegistry& registry,
                                     std::string bot_name,
                                     std::shared_ptr<ErrorHandler> default_error_handler)
    : registry_(registry),
      bot_name_(std::move(bot_name)),
      default_error_handler_(std::move(default_error_handler)) {}

Result<DispatchState> CommandDispatcher::dispatch(const std::string& text,
                                                  const chat::CallerContext& context) const {
    using R = Result<DispatchState>;

    const auto [head, arg_text] = splitCommandFromArgs(text);
    auto resolved = resolveTarget(bot_name_, head);
    if (!resolved) {
        return R::OK(DispatchState::Ignored);
    }

    const ResolvedCommand& cmd = resolved.value();
    const CommandInfo* info = registry_.find(cmd.command);
    if (!info) {
        LOGD("unknown command /{}", cmd.command);
        return R::OK(DispatchState::Ignored);
    }

    const auto target = cmd.explicit_target ? std::optional<std::string>(cmd.target) : std::nullopt;
    if (!filterCommandTarget(target, bot_name_, info->allowed_targets)) {
        LOGD("/{}: addressed to '{}', ignored", info->name(), cmd.target);
        return R::OK(DispatchState::Ignored);
    }
    LOGD("/{}: {}", info->name(), to_string(DispatchState::TargetFiltered));

    chat::CallerContext caller = context;
    caller.command = info->name();

    if (info->permissions && !permission::evaluate(*info->permissions, caller)) {
        LOGI("/{}: permission denied for user {} ({})", info->name(), caller.user_id,
             info->permissions->describe());
        reportError(*info, [&](ErrorHandler& handler) {
            return handler.onPermissionError(caller, *info);
        });
        return R::Error(ResultCode::PermissionDenied,
            fmt::format("user {} may not use /{}", caller.user_id, info->name()));
    }
    LOGD("/{}: {}", info->name(), to_string(DispatchState::PermissionChecked));

    auto args = parseCommandArgs(arg_text, info->arguments);
    if (!args) {
        LOGI("/{}: {} ({})", info->name(), args.error().message, to_string(args.code()));
        const std::string help = generateHelpMessage(*info);
        reportError(*info, [&](ErrorHandler& handler) {
            return handler.onValidationError(caller, *info, args.error(), help);
        });
        return R::Error(args.code(), args.error().message);
    }
    LOGD("/{}: {}", info->name(), to_string(DispatchState::Parsed));

    if (!info->handler) {
        LOGE("/{}: no handler bound", info->name());
        return R::Error(ResultCode::InvalidState, fmt::format("no handler bound to /{}", info->name()));
    }

    message::Message msg{ info->name(), std::move(args.value()) };
    Result<void> outcome;
    try {
        outcome = info->handler(caller, msg);
    } catch (const std::exception& e) {
        outcome = Error(ResultCode::HandlerFailed, e.what());
    }

    if (!outcome) {
        const std::string error = outcome.error().value_or(to_string(outcome.code()));
        reportError(*info, [&](ErrorHandler& handler) {
            return handler.onExecutionError(caller, *info, error);
        });
        return R::Error(ResultCode::HandlerFailed, error);
    }

    LOGD("/{}: {}", info->name(), to_string(DispatchState::Invoked));
    return R::OK(DispatchState::Invoked);
}

} // namespace command
