#pragma once

#include "types.hpp"
#include <string>
#include <vector>

// Cheap pre-fetch screen on raw log lines. Errs toward letting a
// notification through; the classifier makes the real decision.
class LogFilter {
public:
    explicit LogFilter(std::vector<std::string> extra_patterns = {});

    bool is_candidate(const LogNotification& notification) const;
    bool matches(const std::vector<std::string>& logs) const;

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_;
};
