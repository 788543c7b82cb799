#ifndef SIMULATEDEMAILPROVIDER_HPP
#define SIMULATEDEMAILPROVIDER_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "../interfaces/IEmailProvider.hpp"
#include "../interfaces/ILogger.hpp"

// Stand-in for a real email API: each attempt succeeds with probability success_rate.
class SimulatedEmailProvider : public IEmailProvider {
public:
    SimulatedEmailProvider(std::string name,
                           double success_rate,
                           std::shared_ptr<ILogger> logger,
                           std::optional<unsigned int> seed = std::nullopt);

    ~SimulatedEmailProvider() override = default;

    std::string name() const override { return name_; }
    void attemptDelivery(const DeliveryRequest& request) override;

    double successRate() const { return success_rate_; }

private:
    const std::string name_;
    const double success_rate_;
    std::shared_ptr<ILogger> logger_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> distribution_{0.0, 1.0};
};

#endif // SIMULATEDEMAILPROVIDER_HPP
