// rtt_error_handler.cpp
#include "logging/rtt_error_handler.hpp"
#include "SEGGER_RTT.h"

namespace APP {

using namespace Middleware::SystemServices::ERROR;

void RttErrorHandler::HandleError(const ErrorInfo& error) {
    // SEGGER_RTT_printf has no 64-bit conversions
    SEGGER_RTT_printf(0, "[%u ms] %s (0x%x, status %d, info %u) %s:%u\n",
                      static_cast<unsigned>(error.timestamp),
                      GetErrorDescription(error.error_id),
                      static_cast<unsigned>(error.error_id),
                      static_cast<int>(error.status_code),
                      static_cast<unsigned>(error.additional_info),
                      error.location != nullptr ? error.location : "?",
                      static_cast<unsigned>(error.line));
}

bool RttErrorHandler::ShouldHandleError(const ErrorInfo& error) {
    return true;
}

} // namespace APP
