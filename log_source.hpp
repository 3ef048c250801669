#pragma once

#include <memory>
#include <string>
#include <typeinfo>
#include <utility>
#include <variant>

namespace relaylog {

// Extension point for log origins. Equality is by kind type only: two
// sources of the same kind filter as one even if they render different names.
class SourceKind {
public:
    virtual ~SourceKind() = default;
    virtual std::string name() const = 0;
};

// Parameterized source carrying a free-form label. Every LabelSource is the
// same source as far as filters are concerned.
class LabelSource : public SourceKind {
public:
    explicit LabelSource(std::string label) : label_(std::move(label)) {}

    std::string name() const override { return label_; }

private:
    std::string label_;
};

class LogSource {
public:
    // NoSource
    LogSource() = default;

    template<typename Kind, typename... Args>
    static LogSource make(Args&&... args) {
        return LogSource(std::make_shared<const Kind>(std::forward<Args>(args)...));
    }

    static LogSource none() { return LogSource(); }

    static LogSource label(std::string text) {
        return make<LabelSource>(std::move(text));
    }

    bool is_none() const noexcept {
        return std::holds_alternative<std::monostate>(value_);
    }

    // Empty for NoSource
    std::string name() const {
        if (is_none()) {
            return {};
        }
        return std::get<std::shared_ptr<const SourceKind>>(value_)->name();
    }

    friend bool operator==(const LogSource& lhs, const LogSource& rhs) {
        if (lhs.is_none() || rhs.is_none()) {
            return lhs.is_none() && rhs.is_none();
        }
        const auto& lhs_kind = *std::get<std::shared_ptr<const SourceKind>>(lhs.value_);
        const auto& rhs_kind = *std::get<std::shared_ptr<const SourceKind>>(rhs.value_);
        return typeid(lhs_kind) == typeid(rhs_kind);
    }

    friend bool operator!=(const LogSource& lhs, const LogSource& rhs) {
        return !(lhs == rhs);
    }

private:
    explicit LogSource(std::shared_ptr<const SourceKind> kind) : value_(std::move(kind)) {}

    std::variant<std::monostate, std::shared_ptr<const SourceKind>> value_;
};

} // namespace relaylog
