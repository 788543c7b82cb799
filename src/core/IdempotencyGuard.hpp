#ifndef IDEMPOTENCYGUARD_HPP
#define IDEMPOTENCYGUARD_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

// Append-only set of completed request ids. Ids are never evicted, so memory grows
// with the number of distinct successful sends for the lifetime of the guard.
class IdempotencyGuard {
public:
    IdempotencyGuard() = default;

    bool isDuplicate(const std::string& request_id) const;
    void markComplete(const std::string& request_id);
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> completed_;

    IdempotencyGuard(const IdempotencyGuard&) = delete;
    IdempotencyGuard& operator=(const IdempotencyGuard&) = delete;
};

#endif // IDEMPOTENCYGUARD_HPP
