#pragma once

#include <algorithm>
#include <vector>

#include "log_source.hpp"

namespace relaylog {

enum class FilterMode {
    BLACKLIST,  // listed sources are suppressed
    WHITELIST   // only listed sources pass
};

// Mode plus a small set of sources. Copies never share the entry set.
class SourceFilter {
public:
    explicit SourceFilter(FilterMode mode = FilterMode::BLACKLIST) : mode_(mode) {}

    SourceFilter(FilterMode mode, std::vector<LogSource> sources) : mode_(mode) {
        for (auto& source : sources) {
            add(std::move(source));
        }
    }

    FilterMode mode() const noexcept { return mode_; }
    const std::vector<LogSource>& entries() const noexcept { return entries_; }

    // Let messages from this source through
    SourceFilter& include_source(const LogSource& source) {
        if (mode_ == FilterMode::BLACKLIST) {
            remove(source);
        } else {
            add(source);
        }
        return *this;
    }

    // Suppress messages from this source
    SourceFilter& exclude_source(const LogSource& source) {
        if (mode_ == FilterMode::BLACKLIST) {
            add(source);
        } else {
            remove(source);
        }
        return *this;
    }

    bool is_filtered(const LogSource& source) const {
        bool listed = has(source);
        return mode_ == FilterMode::BLACKLIST ? listed : !listed;
    }

    SourceFilter clone() const { return *this; }

    // Same mode and same entries, in any order
    friend bool operator==(const SourceFilter& lhs, const SourceFilter& rhs) {
        if (lhs.mode_ != rhs.mode_ || lhs.entries_.size() != rhs.entries_.size()) {
            return false;
        }
        return std::all_of(lhs.entries_.begin(), lhs.entries_.end(),
                           [&rhs](const LogSource& source) { return rhs.has(source); });
    }

    friend bool operator!=(const SourceFilter& lhs, const SourceFilter& rhs) {
        return !(lhs == rhs);
    }

private:
    FilterMode mode_;
    std::vector<LogSource> entries_;

    bool has(const LogSource& source) const {
        return std::find(entries_.begin(), entries_.end(), source) != entries_.end();
    }

    void add(LogSource source) {
        if (!has(source)) {
            entries_.push_back(std::move(source));
        }
    }

    void remove(const LogSource& source) {
        entries_.erase(std::remove(entries_.begin(), entries_.end(), source), entries_.end());
    }
};

} // namespace relaylog
