#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "result.h"
#include "caller_context.hpp"
#include "command_dispatcher.hpp"
#include "command_registry.hpp"
#include "bot_manifest.hpp"

namespace host {

/**
 * Chat bot on stdin/stdout. One line is one message; a line may start with
 * "@user:" to speak as that user. Replies go to the output stream.
 */
class ConsoleBot {
public:
    static constexpr const char* LOG_TAG = "ConsoleBot";

    ConsoleBot(manifest::BotManifest manifest, std::ostream& out);

    // Loads the command manifest, registers the built-in commands and binds handlers.
    Result<void> setup();

    Result<command::DispatchState> handleLine(const std::string& line);
    void run(std::istream& in);

private:
    chat::CallerContext contextFor(const std::string& username);
    void reply(const chat::CallerContext& context, const std::string& text);

    Result<void> registerBuiltinCommands();
    Result<void> bindHandlers();

    Result<void> onCommandList(const chat::CallerContext& context, const message::Message& args);
    Result<void> onName(const chat::CallerContext& context, const message::Message& args);
    Result<void> onAge(const chat::CallerContext& context, const message::Message& args);
    Result<void> onChildren(const chat::CallerContext& context, const message::Message& args);
    Result<void> onWhois(const chat::CallerContext& context, const message::Message& args);

    manifest::BotManifest manifest_;
    std::ostream& out_;
    command::CommandRegistry registry_;
    std::unique_ptr<command::CommandDispatcher> dispatcher_;

    std::optional<std::string> name_;
    std::optional<double> child_count_;
    int64_t next_message_id_ = 1;
};

} // namespace host
