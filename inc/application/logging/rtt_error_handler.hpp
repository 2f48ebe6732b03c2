// rtt_error_handler.hpp
#pragma once

#include "system_services/error.hpp"

namespace APP {

/**
 * Prints every reported error on RTT channel 0.
 */
class RttErrorHandler : public Middleware::SystemServices::ERROR::IErrorHandler {
public:
    void HandleError(const Middleware::SystemServices::ERROR::ErrorInfo& error) override;
    bool ShouldHandleError(const Middleware::SystemServices::ERROR::ErrorInfo& error) override;
};

} // namespace APP
