#include <iostream>
#include <string>

#include "logging.hpp"
#include "bot_manifest_loader.hpp"
#include "console_bot.hpp"

static constexpr const char* TAG = "Host";

int main(int argc, char** argv) {
    const std::string path = argc > 1 ? argv[1] : "config/bot.yaml";

    auto m = manifest::BotManifestLoader::load(path);
    if (!m) {
        std::cerr << "bot manifest: " << to_string(m.code()) << ": " << m.error().value_or("") << std::endl;
        return 1;
    }

    // YAML based logging setup, plain console logging if that fails
    auto r = m.value().logging.empty()
        ? logging::init(logging::Type::SpdLog)
        : logging::init(logging::Type::SpdLog, m.value().logging);
    if (!r) {
        std::cerr << "logging: " << to_string(r) << std::endl;
        (void)logging::init(logging::Type::Console);
    }

    LOG_INFO(TAG, "starting {} ({})", m.value().bot.name, m.value().bot.description);

    host::ConsoleBot bot(m.value(), std::cout);
    auto s = bot.setup();
    if (!s) {
        LOG_FATAL(TAG, "setup failed: {}", to_string(s));
        std::cerr << "setup failed: " << to_string(s) << std::endl;
        (void)logging::shutdown();
        return 1;
    }

    bot.run(std::cin);

    LOG_INFO(TAG, "stdin closed, bye");
    (void)logging::shutdown();
    return 0;
}
