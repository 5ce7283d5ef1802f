#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

// Bounded, insertion-ordered set of seen signatures. Past capacity the
// oldest entries are evicted first.
class ProcessedSignatureSet {
public:
    explicit ProcessedSignatureSet(size_t capacity = 1000);

    // True if the signature was new (and is now recorded)
    bool insert_if_absent(const std::string& signature);
    bool contains(const std::string& signature) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<std::string> order_;
    std::unordered_set<std::string> seen_;
};
