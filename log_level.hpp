#pragma once

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace relaylog {

// Built-in severities
enum class Severity : int {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3,
    TRACE = 4
};

// Level metadata for formatting
struct LevelMetadata {
    std::string_view name;
    std::string_view color_code;
};

inline const LevelMetadata& get_level_metadata(Severity severity) noexcept {
    switch (severity) {
        case Severity::ERROR: {
            static const LevelMetadata metadata{"Error", "\x1b[91m"};
            return metadata;
        }
        case Severity::WARN: {
            static const LevelMetadata metadata{"Warn", "\x1b[33m"};
            return metadata;
        }
        case Severity::INFO: {
            static const LevelMetadata metadata{"Info", "\x1b[92m"};
            return metadata;
        }
        case Severity::DEBUG: {
            static const LevelMetadata metadata{"Debug", "\x1b[94m"};
            return metadata;
        }
        case Severity::TRACE:
        default: {
            static const LevelMetadata metadata{"Trace", "\x1b[96m"};
            return metadata;
        }
    }
}

// Color used for any level that is not one of the built-ins
inline constexpr std::string_view custom_level_color() noexcept {
    return "\x1b[93m";
}

inline constexpr std::string_view color_reset() noexcept {
    return "\x1b[0m";
}

inline constexpr std::string_view bold() noexcept {
    return "\x1b[1m";
}

// Extension point for user-defined levels. Two levels of the same kind type
// are equal whatever data the kinds carry.
class LevelKind {
public:
    virtual ~LevelKind() = default;
    virtual std::string name() const = 0;
};

class LogLevel {
public:
    LogLevel(Severity severity) : value_(severity) {}

    template<typename Kind, typename... Args>
    static LogLevel make(Args&&... args) {
        return LogLevel(std::make_shared<const Kind>(std::forward<Args>(args)...));
    }

    static LogLevel error() { return LogLevel(Severity::ERROR); }
    static LogLevel warn()  { return LogLevel(Severity::WARN); }
    static LogLevel info()  { return LogLevel(Severity::INFO); }
    static LogLevel debug() { return LogLevel(Severity::DEBUG); }
    static LogLevel trace() { return LogLevel(Severity::TRACE); }

    bool is_builtin() const noexcept {
        return std::holds_alternative<Severity>(value_);
    }

    std::string name() const {
        if (const auto* severity = std::get_if<Severity>(&value_)) {
            return std::string(get_level_metadata(*severity).name);
        }
        return std::get<std::shared_ptr<const LevelKind>>(value_)->name();
    }

    std::string_view color_code() const noexcept {
        if (const auto* severity = std::get_if<Severity>(&value_)) {
            return get_level_metadata(*severity).color_code;
        }
        return custom_level_color();
    }

    friend bool operator==(const LogLevel& lhs, const LogLevel& rhs) {
        if (lhs.value_.index() != rhs.value_.index()) {
            return false;
        }
        if (const auto* severity = std::get_if<Severity>(&lhs.value_)) {
            return *severity == std::get<Severity>(rhs.value_);
        }
        const auto& lhs_kind = *std::get<std::shared_ptr<const LevelKind>>(lhs.value_);
        const auto& rhs_kind = *std::get<std::shared_ptr<const LevelKind>>(rhs.value_);
        return typeid(lhs_kind) == typeid(rhs_kind);
    }

    friend bool operator!=(const LogLevel& lhs, const LogLevel& rhs) {
        return !(lhs == rhs);
    }

private:
    explicit LogLevel(std::shared_ptr<const LevelKind> kind) : value_(std::move(kind)) {}

    std::variant<Severity, std::shared_ptr<const LevelKind>> value_;
};

// Small unordered collection of enabled levels, compared with LogLevel equality
using LevelSet = std::vector<LogLevel>;

inline bool contains(const LevelSet& levels, const LogLevel& level) {
    return std::find(levels.begin(), levels.end(), level) != levels.end();
}

inline LevelSet all_levels() {
    return {LogLevel::error(), LogLevel::warn(), LogLevel::info(),
            LogLevel::debug(), LogLevel::trace()};
}

// Case-insensitive lookup of a built-in level name
inline std::optional<LogLevel> parse_level(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lowered == "error") return LogLevel::error();
    if (lowered == "warn" || lowered == "warning") return LogLevel::warn();
    if (lowered == "info") return LogLevel::info();
    if (lowered == "debug") return LogLevel::debug();
    if (lowered == "trace") return LogLevel::trace();
    return std::nullopt;
}

} // namespace relaylog
