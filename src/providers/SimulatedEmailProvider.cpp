#include "SimulatedEmailProvider.hpp"

#include <stdexcept>
#include <utility>

SimulatedEmailProvider::SimulatedEmailProvider(std::string name,
                                               double success_rate,
                                               std::shared_ptr<ILogger> logger,
                                               std::optional<unsigned int> seed)
    : name_(std::move(name)),
      success_rate_(success_rate),
      logger_(logger),
      rng_(seed ? *seed : std::random_device{}()) {
    if (name_.empty()) {
        throw std::invalid_argument("Provider name cannot be empty");
    }
    if (!(success_rate_ >= 0.0 && success_rate_ <= 1.0)) {
        throw std::invalid_argument("Success rate for " + name_ + " must be within [0, 1]");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for SimulatedEmailProvider");
    }
}

void SimulatedEmailProvider::attemptDelivery(const DeliveryRequest& request) {
    double draw;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        draw = distribution_(rng_);
    }

    if (draw >= success_rate_) {
        throw DeliveryFailure(name_ + " failed to send email");
    }

    logger_->debug("[" + name_ + "] Email sent to " + request.to);
}
