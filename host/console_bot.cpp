#include "console_bot.hpp"

#include <algorithm>
#include <iostream>

#include <fmt/format.h>

#include "logging.hpp"
#include "result_helper.hpp"
#include "builtin_permissions.hpp"
#include "command_help.hpp"
#include "command_helper.hpp"
#include "command_manifest_loader.hpp"
#include "command_target.hpp"
#include "error_handler.hpp"

namespace host {

namespace {

constexpr int64_t EASTER_EGG_USER_ID = 123456;

// Answers denied /children requests and keeps quiet about failures.
class GatekeeperErrorHandler : public command::ErrorHandler {
public:
    explicit GatekeeperErrorHandler(chat::ReplySink reply) : reply_(std::move(reply)) {}

    bool onPermissionError(const chat::CallerContext& context, const command::CommandInfo&) override {
        reply_(context, "YOU SHALL NOT PASS! :hand::mage:");
        return true;
    }

    bool onExecutionError(const chat::CallerContext&, const command::CommandInfo&, const std::string&) override {
        return true;
    }

private:
    chat::ReplySink reply_;
};

} // namespace

ConsoleBot::ConsoleBot(manifest::BotManifest manifest, std::ostream& out)
    : manifest_(std::move(manifest)), out_(out) {}

Result<void> ConsoleBot::setup() {
    auto sink = [this](const chat::CallerContext& context, const std::string& text) { reply(context, text); };

    auto commands = command::CommandManifestLoader::loadFromFile(manifest_.commands);
    RETURN_IF_ERR(commands);

    for (auto& info : commands.value()) {
        if (info.name() == "children") {
            info.error_handler = std::make_shared<GatekeeperErrorHandler>(sink);
        }
    }

    auto r = registry_.registerCommands(std::move(commands.value()));
    RETURN_IF_ERR(r);

    r = registerBuiltinCommands();
    RETURN_IF_ERR(r);

    r = bindHandlers();
    RETURN_IF_ERR(r);

    dispatcher_ = std::make_unique<command::CommandDispatcher>(registry_, manifest_.bot.name,
        std::make_shared<command::DefaultErrorHandler>(sink,
            manifest_.error_handling.silent_denial, manifest_.error_handling.print_error));

    LOGI("{} ready with {} commands", manifest_.bot.name, registry_.size());
    return OK();
}

// age and whois need a validator and a hidden predicate, which the manifest cannot express.
Result<void> ConsoleBot::registerBuiltinCommands() {
    command::ArgumentDescriptor age_desc;
    age_desc.names = { "age", "a" };
    age_desc.description = "The new age";
    age_desc.example = "25";
    age_desc.type = message::ArgType::Int;
    age_desc.validator = command::validateAs<int64_t>([](int64_t age) { return age > 0; });

    auto age_arg = command::Argument::create(std::move(age_desc));
    RETURN_IF_ERR(age_arg);

    auto console_user = permission::Permission::leaf("ConsoleUser",
        [this](const chat::CallerContext& context) { return context.chat_id == manifest_.console.chat_id; });

    command::CommandInfo age;
    age.names = { "age", "a" };
    age.description = "Set age";
    age.arguments = { age_arg.value() };
    age.permissions = permission::allOf(console_user,
        permission::allOf(permission::negate(permission::groupAdmin()),
                          permission::anyOf(permission::userName({ "markusressel" }),
                                            permission::userId({ EASTER_EGG_USER_ID }))));

    auto r = registry_.registerCommand(std::move(age));
    RETURN_IF_ERR(r);

    command::CommandInfo whois;
    whois.names = { "whois" };
    whois.description = "Some easter-egg";
    whois.hidden = [](const chat::CallerContext& context) { return context.user_id != EASTER_EGG_USER_ID; };

    return registry_.registerCommand(std::move(whois));
}

Result<void> ConsoleBot::bindHandlers() {
    using namespace std::placeholders;

    const std::pair<const char*, command::Handler> handlers[] = {
        { "help",     std::bind(&ConsoleBot::onCommandList, this, _1, _2) },
        { "start",    std::bind(&ConsoleBot::onCommandList, this, _1, _2) },
        { "name",     std::bind(&ConsoleBot::onName, this, _1, _2) },
        { "age",      std::bind(&ConsoleBot::onAge, this, _1, _2) },
        { "children", std::bind(&ConsoleBot::onChildren, this, _1, _2) },
        { "whois",    std::bind(&ConsoleBot::onWhois, this, _1, _2) },
    };
    for (const auto& [name, handler] : handlers) {
        auto r = registry_.bindHandler(name, handler);
        RETURN_IF_ERR(r);
    }
    return OK();
}

chat::CallerContext ConsoleBot::contextFor(const std::string& username) {
    const auto& console = manifest_.console;

    chat::CallerContext context;
    context.username = username;
    auto user = console.users.find(username);
    context.user_id = (user == console.users.end()) ? 0 : user->second;
    context.chat_id = console.chat_id;
    context.chat_type = console.chat_type;
    context.message_id = next_message_id_++;
    context.member_status = [&console, username](int64_t, int64_t) {
        if (!console.creator.empty() && username == console.creator) return chat::MemberStatus::Creator;
        if (std::find(console.admins.begin(), console.admins.end(), username) != console.admins.end()) {
            return chat::MemberStatus::Administrator;
        }
        return chat::MemberStatus::Member;
    };
    return context;
}

void ConsoleBot::reply(const chat::CallerContext& context, const std::string& text) {
    out_ << "[" << manifest_.bot.name << " -> @" << context.username << "] " << text << std::endl;
}

Result<command::DispatchState> ConsoleBot::handleLine(const std::string& line) {
    if (!dispatcher_) {
        return Result<command::DispatchState>::Error(ResultCode::InvalidState, "setup() has not run");
    }

    std::string text = line;
    std::string username = manifest_.console.username;
    if (!text.empty() && text.front() == '@') {
        const auto colon = text.find(':');
        if (colon != std::string::npos) {
            username = text.substr(1, colon - 1);
            text = text.substr(colon + 1);
        }
    }

    const auto context = contextFor(username);
    auto r = dispatcher_->dispatch(text, context);
    if (!r) {
        LOGD("'{}' rejected: {}", text, to_string(r.code()));
        return r;
    }

    // an unknown command addressed to us gets the command list
    if (r.value() == command::DispatchState::Ignored) {
        auto resolved = command::resolveTarget(manifest_.bot.name, command::splitCommandFromArgs(text).first);
        if (resolved && resolved.value().target == manifest_.bot.name && !registry_.find(resolved.value().command)) {
            reply(context, command::generateCommandList(registry_, context));
        }
    }
    return r;
}

void ConsoleBot::run(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        // rejections are already answered by the error handlers
        auto r = handleLine(line);
        if (r.code() == ResultCode::InvalidState) LOG_IF_ERR(r);
    }
}

Result<void> ConsoleBot::onCommandList(const chat::CallerContext& context, const message::Message&) {
    reply(context, command::generateCommandList(registry_, context));
    return OK();
}

Result<void> ConsoleBot::onName(const chat::CallerContext& context, const message::Message& args) {
    using command::CommandHelper;

    std::string text;
    if (CommandHelper::has(args, "name")) {
        name_ = CommandHelper::get<std::string>(args, "name");
        text = fmt::format("New: {}", *name_);
    } else {
        text = fmt::format("Current: {}", name_.value_or("None"));
    }
    text += fmt::format("\nFlag is: {}", CommandHelper::getOr<bool>(args, "flag", false));
    text += fmt::format("\nFlag2 is: {}", CommandHelper::getOr<bool>(args, "flag2", false));
    reply(context, text);
    return OK();
}

Result<void> ConsoleBot::onAge(const chat::CallerContext& context, const message::Message& args) {
    reply(context, fmt::format("New age: {}", command::CommandHelper::get<int64_t>(args, "age")));
    return OK();
}

Result<void> ConsoleBot::onChildren(const chat::CallerContext& context, const message::Message& args) {
    using command::CommandHelper;

    if (!CommandHelper::has(args, "amount")) {
        reply(context, child_count_ ? fmt::format("Current: {}", *child_count_) : std::string("Current: None"));
        return OK();
    }
    child_count_ = CommandHelper::get<double>(args, "amount");
    reply(context, fmt::format("New: {}", *child_count_));
    return OK();
}

Result<void> ConsoleBot::onWhois(const chat::CallerContext& context, const message::Message&) {
    reply(context, std::to_string(context.user_id));
    return OK();
}

} // namespace host
