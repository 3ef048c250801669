#pragma once

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "backend.hpp"
#include "mailbox.hpp"

namespace relaylog {

// Front-line logger. Every call is queued and, when processed, forwarded to
// each registered backend in registration order without waiting for them.
// A Dispatcher is itself a LoggingBackend and can be nested in another one.
class Dispatcher : public LoggingBackend {
public:
    Dispatcher() = default;

    explicit Dispatcher(std::vector<BackendPtr> backends)
        : backends_(std::move(backends))
    {}

    ~Dispatcher() override {
        shutdown();
    }

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Backend management
    void append_backend(BackendPtr backend) {
        if (!backend) {
            return;
        }
        mailbox_.post([this, backend = std::move(backend)]() mutable {
            backends_.push_back(std::move(backend));
        });
    }

    // Replaces the list with a copy of `backends`; dropped backends get no notice
    void set_backends(std::vector<BackendPtr> backends) {
        mailbox_.post([this, backends = std::move(backends)]() mutable {
            backends_.clear();
            for (auto& backend : backends) {
                if (backend) {
                    backends_.push_back(std::move(backend));
                }
            }
        });
    }

    // Configuration, broadcast to every backend
    void set_levels(LevelSet levels) override {
        broadcast([levels = std::move(levels)](LoggingBackend& backend) {
            backend.set_levels(levels);
        });
    }

    void enable_levels(LevelSet levels) override {
        broadcast([levels = std::move(levels)](LoggingBackend& backend) {
            backend.enable_levels(levels);
        });
    }

    void disable_levels(LevelSet levels) override {
        broadcast([levels = std::move(levels)](LoggingBackend& backend) {
            backend.disable_levels(levels);
        });
    }

    void set_source_filter(const SourceFilter& filter) override {
        broadcast([filter = filter.clone()](LoggingBackend& backend) {
            backend.set_source_filter(filter);
        });
    }

    void include_source(LogSource source) override {
        broadcast([source = std::move(source)](LoggingBackend& backend) {
            backend.include_source(source);
        });
    }

    void exclude_source(LogSource source) override {
        broadcast([source = std::move(source)](LoggingBackend& backend) {
            backend.exclude_source(source);
        });
    }

    void set_formatter(FormatterPtr formatter) override {
        if (!formatter) {
            return;
        }
        broadcast([formatter = std::move(formatter)](LoggingBackend& backend) {
            backend.set_formatter(formatter);
        });
    }

    void set_formatting_preference(bool styled) override {
        broadcast([styled](LoggingBackend& backend) {
            backend.set_formatting_preference(styled);
        });
    }

    // Logging
    void log(LogLevel level, std::string message, LogSource source = {}) override {
        broadcast([level = std::move(level), message = std::move(message),
                   source = std::move(source)](LoggingBackend& backend) {
            backend.log(level, message, source);
        });
    }

    void err(std::string message, LogSource source = {}) {
        log(LogLevel::error(), std::move(message), std::move(source));
    }

    void warn(std::string message, LogSource source = {}) {
        log(LogLevel::warn(), std::move(message), std::move(source));
    }

    void info(std::string message, LogSource source = {}) {
        log(LogLevel::info(), std::move(message), std::move(source));
    }

    void debug(std::string message, LogSource source = {}) {
        log(LogLevel::debug(), std::move(message), std::move(source));
    }

    void trace(std::string message, LogSource source = {}) {
        log(LogLevel::trace(), std::move(message), std::move(source));
    }

    // Drains this dispatcher, then every backend registered at that point
    void flush() override {
        auto snapshot = std::make_shared<std::vector<BackendPtr>>();
        mailbox_.post([this, snapshot] { *snapshot = backends_; });
        mailbox_.drain();
        for (const auto& backend : *snapshot) {
            backend->flush();
        }
    }

    void shutdown() {
        mailbox_.shutdown();
    }

private:
    std::vector<BackendPtr> backends_;

    // Declared last: its worker touches backends_ and must stop first
    Mailbox mailbox_;

    // A backend that throws does not keep the call from the ones after it
    template<typename Send>
    void broadcast(Send send) {
        mailbox_.post([this, send = std::move(send)] {
            for (const auto& backend : backends_) {
                try {
                    send(*backend);
                } catch (const std::exception& e) {
                    std::cerr << "relaylog: backend error: " << e.what() << '\n';
                } catch (...) {
                    std::cerr << "relaylog: backend error: unknown exception\n";
                }
            }
        });
    }
};

} // namespace relaylog
