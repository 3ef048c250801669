#include "logger.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

struct NetworkSource : relaylog::SourceKind {
    std::string name() const override { return "network"; }
};

struct StorageSource : relaylog::SourceKind {
    std::string name() const override { return "storage"; }
};

// Application-specific level on top of the five built-ins
struct AuditLevel : relaylog::LevelKind {
    std::string name() const override { return "Audit"; }
};

} // namespace

int main(int argc, char** argv) {
    using namespace relaylog;

    // Optional minimum verbosity for the console, e.g. "relaylog_demo debug"
    LevelSet console_levels = {LogLevel::error(), LogLevel::warn(), LogLevel::info()};
    if (argc > 1) {
        auto requested = parse_level(argv[1]);
        if (!requested) {
            std::cerr << "unknown level '" << argv[1] << "' (error|warn|info|debug|trace)\n";
            return 2;
        }
        console_levels.clear();
        for (const auto& level : all_levels()) {
            console_levels.push_back(level);
            if (level == *requested) {
                break;
            }
        }
    }

    auto network = LogSource::make<NetworkSource>();
    auto storage = LogSource::make<StorageSource>();
    auto audit = LogLevel::make<AuditLevel>();

    Dispatcher logging;

    auto console_cfg = console_config();
    console_cfg.levels = console_levels;
    logging.append_backend(make_console_backend(std::move(console_cfg)));

    try {
        BackendConfig file_cfg;
        file_cfg.formatter = std::make_shared<const StrftimeFormatter>("%Y-%m-%d %H:%M:%S");
        file_cfg.levels.push_back(audit);
        logging.append_backend(make_file_backend("relaylog_demo.log", std::move(file_cfg)));
    } catch (const std::exception& e) {
        std::cerr << "file logging disabled: " << e.what() << '\n';
    }

    logging.info("Application started");
    logging.warn("Connection slow", network);
    logging.debug("Cache warmed", storage);
    logging.log(audit, "User alice logged in");

    // Silence the noisy subsystem everywhere
    logging.exclude_source(network);
    logging.err("Connection dropped", network);
    logging.err("Disk nearly full", storage);

    logging.set_formatter(std::make_shared<const RelativeTimeFormatter>());
    logging.info("Switched to relative timestamps");

    logging.flush();
    logging.shutdown();
    return 0;
}
