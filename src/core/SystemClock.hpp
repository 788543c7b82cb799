#ifndef SYSTEMCLOCK_HPP
#define SYSTEMCLOCK_HPP

#include <chrono>

#include "../interfaces/IClock.hpp"

class SystemClock : public IClock {
public:
    ~SystemClock() override = default;

    std::chrono::steady_clock::time_point now() const override;
    std::chrono::system_clock::time_point wallNow() const override;
    void sleepFor(std::chrono::milliseconds delay) override;
};

#endif // SYSTEMCLOCK_HPP
