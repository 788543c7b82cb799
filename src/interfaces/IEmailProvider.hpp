#pragma once

#include <stdexcept>
#include <string>

#include "../models/DeliveryRequest.hpp"

// Thrown by a provider when it cannot complete a send. what() is the human-readable reason.
class DeliveryFailure : public std::runtime_error {
public:
    explicit DeliveryFailure(const std::string& reason) : std::runtime_error(reason) {}
};

class IEmailProvider {
public:
    virtual ~IEmailProvider() = default;

    // Unique name, used for breaker lookup, logging and DeliveryOutcome::providerUsed
    virtual std::string name() const = 0;

    // Returns normally on success, throws DeliveryFailure otherwise.
    virtual void attemptDelivery(const DeliveryRequest& request) = 0;
};
