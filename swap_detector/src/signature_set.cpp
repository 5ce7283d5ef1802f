#include "signature_set.hpp"
#include <stdexcept>

ProcessedSignatureSet::ProcessedSignatureSet(size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("ProcessedSignatureSet capacity must be positive");
    }
}

bool ProcessedSignatureSet::insert_if_absent(const std::string& signature) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!seen_.insert(signature).second) {
        return false;
    }
    order_.push_back(signature);

    while (order_.size() > capacity_) {
        seen_.erase(order_.front());
        order_.pop_front();
    }
    return true;
}

bool ProcessedSignatureSet::contains(const std::string& signature) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.count(signature) > 0;
}

size_t ProcessedSignatureSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

void ProcessedSignatureSet::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_.clear();
    order_.clear();
}
