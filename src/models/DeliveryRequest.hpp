#ifndef DELIVERYREQUEST_HPP
#define DELIVERYREQUEST_HPP

#include <string>

// --- An outbound email. requestId is the caller-supplied idempotency key. ---
struct DeliveryRequest {
    std::string to;
    std::string subject;
    std::string body;
    std::string requestId;

    bool isComplete() const {
        return !to.empty() && !subject.empty() && !body.empty() && !requestId.empty();
    }
};

#endif // DELIVERYREQUEST_HPP
