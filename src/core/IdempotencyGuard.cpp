#include "IdempotencyGuard.hpp"

bool IdempotencyGuard::isDuplicate(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_.count(request_id) > 0;
}

void IdempotencyGuard::markComplete(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    completed_.insert(request_id);
}

size_t IdempotencyGuard::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_.size();
}
