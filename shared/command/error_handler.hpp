#pragma once

#include <string>
#include <utility>

#include "caller_context.hpp"
#include "command_def.hpp"
#include "parse_error.hpp"

namespace command {

/**
 * Reacts to a rejected or failed command. Every hook returns true when it
 * handled the error; false passes it on to the next handler.
 */
class ErrorHandler {
public:
    virtual ~ErrorHandler() = default;

    virtual bool onPermissionError(const chat::CallerContext& context, const CommandInfo& info) {
        (void)context; (void)info;
        return false;
    }

    // help: generated help message of the command
    virtual bool onValidationError(const chat::CallerContext& context, const CommandInfo& info,
                                   const ParseError& error, const std::string& help) {
        (void)context; (void)info; (void)error; (void)help;
        return false;
    }

    virtual bool onExecutionError(const chat::CallerContext& context, const CommandInfo& info,
                                  const std::string& error) {
        (void)context; (void)info; (void)error;
        return false;
    }
};

// Replies through the sink and always reports the error as handled.
class DefaultErrorHandler : public ErrorHandler {
public:
    static constexpr const char* LOG_TAG = "ErrorHandler";

    static constexpr const char* PERMISSION_DENIED_MESSAGE =
        ":stop_sign: You do not have permission to use this command.";
    static constexpr const char* EXECUTION_FAILED_MESSAGE =
        ":boom: There was an error executing your command :worried:";

    explicit DefaultErrorHandler(chat::ReplySink reply, bool silent_denial = true, bool print_error = false)
        : reply_(std::move(reply)), silent_denial_(silent_denial), print_error_(print_error) {}

    bool onPermissionError(const chat::CallerContext& context, const CommandInfo& info) override;
    bool onValidationError(const chat::CallerContext& context, const CommandInfo& info,
                           const ParseError& error, const std::string& help) override;
    bool onExecutionError(const chat::CallerContext& context, const CommandInfo& info,
                          const std::string& error) override;

    bool silentDenial() const { return silent_denial_; }
    bool printError() const { return print_error_; }

private:
    void send(const chat::CallerContext& context, const std::string& text);

    chat::ReplySink reply_;
    bool silent_denial_;
    bool print_error_;
};

} // namespace command
