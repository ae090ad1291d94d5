#include "error_handler.hpp"

#include <fmt/format.h>

#include "logging.hpp"

namespace command {

void DefaultErrorHandler::send(const chat::CallerContext& context, const std::string& text) {
    if (!reply_) {
        LOGW("no reply sink, dropping reply to chat {}", context.chat_id);
        return;
    }
    reply_(context, text);
}

bool DefaultErrorHandler::onPermissionError(const chat::CallerContext& context, const CommandInfo& info) {
    LOGI("user {} denied /{}", context.user_id, info.name());
    if (!silent_denial_) {
        send(context, PERMISSION_DENIED_MESSAGE);
    }
    return true;
}

bool DefaultErrorHandler::onValidationError(const chat::CallerContext& context, const CommandInfo& info,
                                            const ParseError& error, const std::string& help) {
    LOGI("invalid /{} from user {}: {}", info.name(), context.user_id, error.message);
    send(context, fmt::format(":exclamation: `{}`\n\n{}", error.message, help));
    return true;
}

bool DefaultErrorHandler::onExecutionError(const chat::CallerContext& context, const CommandInfo& info,
                                           const std::string& error) {
    LOGE("/{} failed: {}", info.name(), error);
    if (print_error_) {
        send(context, fmt::format(":boom: `{}`", error));
    } else {
        send(context, EXECUTION_FAILED_MESSAGE);
    }
    return true;
}

} // namespace command
