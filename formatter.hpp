#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "log_level.hpp"
#include "log_source.hpp"

namespace relaylog {

// Turns one admitted log event into a single line of text. Implementations
// must be pure and must not throw: internal failures are replaced by a fixed
// sentinel inside the rendered line.
class Formatter {
public:
    virtual ~Formatter() = default;
    virtual std::string render(const LogLevel& level, std::string_view message,
                               const LogSource& source, bool styled) const = 0;
};

using FormatterPtr = std::shared_ptr<const Formatter>;

// Substituted for a timestamp that cannot be rendered
inline constexpr std::string_view formatting_error_text() noexcept {
    return "FORMATTING ERROR";
}

using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock system_clock_source() {
    return [] { return std::chrono::system_clock::now(); };
}

// Wall-clock instant split into whole seconds and nanoseconds (0..999999999)
struct Timespec {
    std::int64_t seconds = 0;
    std::int64_t nanoseconds = 0;
};

inline Timespec to_timespec(std::chrono::system_clock::time_point tp) {
    auto whole = std::chrono::floor<std::chrono::seconds>(tp);
    auto rest = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - whole);
    return {static_cast<std::int64_t>(whole.time_since_epoch().count()),
            static_cast<std::int64_t>(rest.count())};
}

// Borrowing subtraction; the result goes negative when later < earlier
inline Timespec elapsed_between(const Timespec& earlier, const Timespec& later) {
    Timespec diff{later.seconds - earlier.seconds, later.nanoseconds - earlier.nanoseconds};
    if (diff.nanoseconds < 0) {
        diff.seconds -= 1;
        diff.nanoseconds += 1000000000;
    }
    return diff;
}

namespace detail {

inline std::string styled_level(const LogLevel& level, bool styled) {
    if (!styled) {
        return level.name();
    }
    std::string result(level.color_code());
    result += level.name();
    result += color_reset();
    return result;
}

inline std::string styled_source(const LogSource& source, bool styled) {
    if (!styled) {
        return source.name();
    }
    std::string result(bold());
    result += source.name();
    result += color_reset();
    return result;
}

// "<seconds>" or "<seconds>.<mmm>"
inline std::string seconds_text(const Timespec& ts, bool show_fraction) {
    std::string result = std::to_string(ts.seconds);
    if (show_fraction) {
        std::string millis = std::to_string(ts.nanoseconds / 1000000);
        result += '.';
        result.append(3 - std::min<std::size_t>(3, millis.size()), '0');
        result += millis;
    }
    return result;
}

// "[<time>] [<level>] <source>: <message>", source segment dropped for NoSource
inline std::string time_prefixed(std::string_view time_text, const LogLevel& level,
                                 std::string_view message, const LogSource& source,
                                 bool styled) {
    std::string result;
    result.reserve(time_text.size() + message.size() + 32);
    result += '[';
    result += time_text;
    result += "] [";
    result += styled_level(level, styled);
    result += "] ";
    if (!source.is_none()) {
        result += styled_source(source, styled);
        result += ": ";
    }
    result += message;
    return result;
}

} // namespace detail

// "[<source>] <level>: <message>" or "<level>: <message>"
class BasicFormatter : public Formatter {
public:
    std::string render(const LogLevel& level, std::string_view message,
                       const LogSource& source, bool /*styled*/) const override {
        std::string result;
        if (!source.is_none()) {
            result += '[';
            result += source.name();
            result += "] ";
        }
        result += level.name();
        result += ": ";
        result += message;
        return result;
    }
};

// "[<level>] <source>: <message>" with the level colored and the source bold
// when styling is allowed
class AnsiFormatter : public Formatter {
public:
    std::string render(const LogLevel& level, std::string_view message,
                       const LogSource& source, bool styled) const override {
        std::string result;
        result += '[';
        result += detail::styled_level(level, styled);
        result += "] ";
        if (!source.is_none()) {
            result += detail::styled_source(source, styled);
            result += ": ";
        }
        result += message;
        return result;
    }
};

// Absolute wall-clock seconds since the epoch. Not monotonic: jumps with
// the system clock.
class TimeFormatter : public Formatter {
public:
    explicit TimeFormatter(bool show_fraction = true, Clock clock = system_clock_source())
        : show_fraction_(show_fraction), clock_(std::move(clock)) {}

    std::string render(const LogLevel& level, std::string_view message,
                       const LogSource& source, bool styled) const override {
        auto now = to_timespec(clock_());
        return detail::time_prefixed(detail::seconds_text(now, show_fraction_),
                                     level, message, source, styled);
    }

private:
    bool show_fraction_;
    Clock clock_;
};

// Seconds elapsed since this formatter was created. Uses the wall clock, so
// the value goes negative if the system time is set back after creation.
class RelativeTimeFormatter : public Formatter {
public:
    explicit RelativeTimeFormatter(bool show_fraction = true, Clock clock = system_clock_source())
        : show_fraction_(show_fraction)
        , clock_(std::move(clock))
        , created_(to_timespec(clock_()))
    {}

    std::string render(const LogLevel& level, std::string_view message,
                       const LogSource& source, bool styled) const override {
        auto elapsed = elapsed_between(created_, to_timespec(clock_()));
        return detail::time_prefixed(detail::seconds_text(elapsed, show_fraction_),
                                     level, message, source, styled);
    }

    const Timespec& created() const noexcept { return created_; }

private:
    bool show_fraction_;
    Clock clock_;
    Timespec created_;
};

// Timestamp rendered through std::strftime with a caller-supplied pattern
class StrftimeFormatter : public Formatter {
public:
    enum class Zone {
        UTC,
        LOCAL
    };

    explicit StrftimeFormatter(std::string pattern = "%Y-%m-%d %H:%M:%S",
                               Zone zone = Zone::LOCAL,
                               Clock clock = system_clock_source())
        : pattern_(std::move(pattern)), zone_(zone), clock_(std::move(clock)) {}

    std::string render(const LogLevel& level, std::string_view message,
                       const LogSource& source, bool styled) const override {
        return detail::time_prefixed(format_time(clock_()), level, message, source, styled);
    }

    const std::string& pattern() const noexcept { return pattern_; }

    // Conversions accepted in a pattern: the POSIX set plus the glibc
    // extensions (%k %l %s %P), each optionally preceded by glibc flags
    // (_ - 0 ^ #), a field width and an E/O modifier
    static bool is_valid_pattern(std::string_view pattern) {
        constexpr std::string_view conversions = "aAbBcCdDeFgGhHIjklmMnpPrRsStTuUVwWxXyYzZ%";
        constexpr std::string_view flags = "_-0^#";
        for (std::size_t i = 0; i < pattern.size(); ++i) {
            if (pattern[i] != '%') {
                continue;
            }
            if (++i == pattern.size()) {
                return false;
            }
            while (i < pattern.size() && flags.find(pattern[i]) != std::string_view::npos) {
                ++i;
            }
            while (i < pattern.size() && pattern[i] >= '0' && pattern[i] <= '9') {
                ++i;
            }
            if (i == pattern.size()) {
                return false;
            }
            if (pattern[i] == 'E' || pattern[i] == 'O') {
                if (++i == pattern.size()) {
                    return false;
                }
            }
            if (conversions.find(pattern[i]) == std::string_view::npos) {
                return false;
            }
        }
        return true;
    }

private:
    std::string pattern_;
    Zone zone_;
    Clock clock_;

    std::string format_time(std::chrono::system_clock::time_point tp) const {
        if (pattern_.empty()) {
            return {};
        }
        if (!is_valid_pattern(pattern_)) {
            return std::string(formatting_error_text());
        }

        auto time_t_val = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_val{};
        bool converted = (zone_ == Zone::UTC)
            ? gmtime_r(&time_t_val, &tm_val) != nullptr
            : localtime_r(&time_t_val, &tm_val) != nullptr;
        if (!converted) {
            return std::string(formatting_error_text());
        }

        // Leading guard character: a zero return then only means the output did not fit
        std::string guarded = " " + pattern_;
        char timestamp_buffer[256] = {0};
        std::size_t written = std::strftime(timestamp_buffer, sizeof(timestamp_buffer),
                                            guarded.c_str(), &tm_val);
        if (written == 0) {
            return std::string(formatting_error_text());
        }
        return std::string(timestamp_buffer + 1, written - 1);
    }
};

inline FormatterPtr make_basic_formatter() {
    return std::make_shared<const BasicFormatter>();
}

inline FormatterPtr make_ansi_formatter() {
    return std::make_shared<const AnsiFormatter>();
}

} // namespace relaylog
