#pragma once

#include <memory>
#include <string>

#include "result.h"
#include "caller_context.hpp"
#include "command_def.hpp"
#include "command_registry.hpp"
#include "error_handler.hpp"

namespace command {

// Received -> TargetFiltered -> PermissionChecked -> Parsed -> Invoked.
// Ignored ends a dispatch silently; rejections are returned as error codes.
enum class DispatchState {
    Received,
    TargetFiltered,
    PermissionChecked,
    Parsed,
    Invoked,
    Ignored
};

const char* to_string(DispatchState state);

/**
 * Runs one chat message through routing, permission check, argument
 * parsing and the bound handler.
 *
 * Returns Invoked or Ignored on success. A rejection returns
 * PermissionDenied, the parse error code, HandlerFailed, or InvalidState
 * for a command without handler, after the error handlers had their turn.
 */
class CommandDispatcher {
public:
    static constexpr const char* LOG_TAG = "CommandDispatcher";

    CommandDispatcher(const CommandRegistry& registry,
                      std::string bot_name,
                      std::shared_ptr<ErrorHandler> default_error_handler);

    Result<DispatchState> dispatch(const std::string& text, const chat::CallerContext& context) const;

    const std::string& botName() const { return bot_name_; }

private:
    // Command's own handler first, the default one if it declines.
    template <typename F>
    void reportError(const CommandInfo& info, F&& hook) const {
        if (info.error_handler && hook(*info.error_handler)) return;
        if (default_error_handler_) hook(*default_error_handler_);
    }

    const CommandRegistry& registry_;
    std::string bot_name_;
    std::shared_ptr<ErrorHandler> default_error_handler_;
};

} // namespace command
