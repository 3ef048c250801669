#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "formatter.hpp"
#include "log_level.hpp"
#include "log_source.hpp"
#include "mailbox.hpp"
#include "source_filter.hpp"

namespace relaylog {

using LogSink = std::function<void(const std::string&)>;

// Everything a Dispatcher can ask of a backend. All calls return immediately;
// their effects are applied later, in call order, by the receiving backend.
class LoggingBackend {
public:
    virtual ~LoggingBackend() = default;

    virtual void set_levels(LevelSet levels) = 0;
    virtual void enable_levels(LevelSet levels) = 0;
    virtual void disable_levels(LevelSet levels) = 0;

    virtual void set_source_filter(const SourceFilter& filter) = 0;
    virtual void include_source(LogSource source) = 0;
    virtual void exclude_source(LogSource source) = 0;

    virtual void set_formatter(FormatterPtr formatter) = 0;
    virtual void set_formatting_preference(bool styled) = 0;

    virtual void log(LogLevel level, std::string message, LogSource source = {}) = 0;

    // Blocks until everything sent before it has been applied
    virtual void flush() = 0;
};

using BackendPtr = std::shared_ptr<LoggingBackend>;

// Initial state of a Backend
struct BackendConfig {
    LevelSet levels = all_levels();
    SourceFilter filter = SourceFilter(FilterMode::BLACKLIST);
    FormatterPtr formatter = make_basic_formatter();
    bool styled = false;            // style hint requested by the user
    bool sink_supports_styling = true;

    BackendConfig() = default;
    explicit BackendConfig(LevelSet lvls, SourceFilter f = SourceFilter(FilterMode::BLACKLIST))
        : levels(std::move(lvls)), filter(std::move(f)) {}
};

// Sink adapter with its own level set, source filter and formatter
class Backend : public LoggingBackend {
public:
    explicit Backend(LogSink sink, BackendConfig config = BackendConfig())
        : sink_(std::move(sink))
        , levels_(std::move(config.levels))
        , filter_(std::move(config.filter))
        , formatter_(config.formatter ? std::move(config.formatter) : make_basic_formatter())
        , styled_(config.styled)
        , sink_supports_styling_(config.sink_supports_styling)
    {}

    ~Backend() override {
        shutdown();
    }

    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    void set_levels(LevelSet levels) override {
        mailbox_.post([this, levels = std::move(levels)]() mutable {
            levels_ = std::move(levels);
        });
    }

    void enable_levels(LevelSet levels) override {
        mailbox_.post([this, levels = std::move(levels)] {
            LevelSet updated = levels_;
            bool changed = false;
            for (const auto& level : levels) {
                if (!contains(updated, level)) {
                    updated.push_back(level);
                    changed = true;
                }
            }
            if (changed) {
                levels_ = std::move(updated);
            }
        });
    }

    void disable_levels(LevelSet levels) override {
        mailbox_.post([this, levels = std::move(levels)] {
            LevelSet updated;
            updated.reserve(levels_.size());
            for (const auto& level : levels_) {
                if (!contains(levels, level)) {
                    updated.push_back(level);
                }
            }
            if (updated.size() != levels_.size()) {
                levels_ = std::move(updated);
            }
        });
    }

    void set_source_filter(const SourceFilter& filter) override {
        mailbox_.post([this, filter = filter.clone()]() mutable {
            filter_ = std::move(filter);
        });
    }

    void include_source(LogSource source) override {
        mailbox_.post([this, source = std::move(source)] {
            filter_.include_source(source);
        });
    }

    void exclude_source(LogSource source) override {
        mailbox_.post([this, source = std::move(source)] {
            filter_.exclude_source(source);
        });
    }

    void set_formatter(FormatterPtr formatter) override {
        if (!formatter) {
            return;
        }
        mailbox_.post([this, formatter = std::move(formatter)]() mutable {
            formatter_ = std::move(formatter);
        });
    }

    void set_formatting_preference(bool styled) override {
        mailbox_.post([this, styled] {
            styled_ = styled;
        });
    }

    void log(LogLevel level, std::string message, LogSource source = {}) override {
        mailbox_.post([this, level = std::move(level), message = std::move(message),
                       source = std::move(source)] {
            emit(level, message, source);
        });
    }

    void flush() override {
        mailbox_.drain();
    }

    // Processes queued messages, then stops accepting new ones
    void shutdown() {
        mailbox_.shutdown();
    }

private:
    LogSink sink_;
    LevelSet levels_;
    SourceFilter filter_;
    FormatterPtr formatter_;
    bool styled_;
    const bool sink_supports_styling_;

    // Declared last: its worker touches the members above and must stop first
    Mailbox mailbox_;

    void emit(const LogLevel& level, const std::string& message, const LogSource& source) {
        if (!contains(levels_, level) || filter_.is_filtered(source)) {
            return;
        }
        try {
            sink_(formatter_->render(level, message, source, styled_ && sink_supports_styling_));
        } catch (const std::exception& e) {
            // Logging failures must not take the backend down
            std::cerr << "relaylog: sink error: " << e.what() << '\n';
        } catch (...) {
            std::cerr << "relaylog: sink error: unknown exception\n";
        }
    }
};

} // namespace relaylog
