#include "system_services/error.hpp"
#include "system_services/system_timing.hpp"
#include <algorithm>
#include <cstdlib>

namespace Middleware {
namespace SystemServices {
    namespace ERROR {

// Static member initialization
std::array<ErrorInfo, ERROR_HISTORY_SIZE> ErrorManager::error_history;
std::atomic<size_t> ErrorManager::error_index(0);
std::array<IErrorHandler*, MAX_ERROR_HANDLERS> ErrorManager::error_handlers;
std::atomic<size_t> ErrorManager::handler_count(0);
ErrorVerbosityLevel ErrorManager::verbosity_level = ErrorVerbosityLevel::Normal;

void ErrorManager::Record(const ErrorInfo& error) {
    // Store in circular buffer
    size_t index = error_index.fetch_add(1) % ERROR_HISTORY_SIZE;
    error_history[index] = error;
}

void ErrorManager::Dispatch(const ErrorInfo& error) {
    // Notify all registered handlers
    for (size_t i = 0; i < handler_count; ++i) {
        IErrorHandler* handler = error_handlers[i];
        if (handler && handler->ShouldHandleError(error)) {
            handler->HandleError(error);
        }
    }
}

void ErrorManager::LogError(const ErrorInfo& error) {
    // Only log based on verbosity level
    switch (verbosity_level) {
        case ErrorVerbosityLevel::None:
            return;
        case ErrorVerbosityLevel::Critical:
            if (error.status_code != Platform::Status::HARDWARE_ERROR &&
                error.status_code != Platform::Status::COMMUNICATION_ERROR) {
                return;
            }
            break;
        case ErrorVerbosityLevel::Normal:
            if (error.status_code == Platform::Status::OK) {
                return;
            }
            break;
        case ErrorVerbosityLevel::Debug:
            // Log everything in debug mode
            break;
    }

    Record(error);
    Dispatch(error);
}

void ErrorManager::ReportFatal(const ErrorInfo& error) {
    Record(error);
    Dispatch(error);
    std::abort();
}

uint64_t ErrorManager::GetTimestamp() {
    // Get timestamp from system timing service
    return Middleware::SystemServices::SystemTiming::GetInstance().GetMilliseconds();
}

void ErrorManager::RegisterErrorHandler(IErrorHandler* handler) {
    if (!handler) return;

    size_t index = handler_count.fetch_add(1);
    if (index < MAX_ERROR_HANDLERS) {
        error_handlers[index] = handler;
    } else {
        // Too many handlers, roll back the counter
        handler_count.fetch_sub(1);
    }
}

void ErrorManager::UnregisterErrorHandler(IErrorHandler* handler) {
    size_t count = handler_count.load();
    for (size_t i = 0; i < count; ++i) {
        if (error_handlers[i] == handler) {
            // Keep the table dense
            for (size_t j = i; j + 1 < count; ++j) {
                error_handlers[j] = error_handlers[j + 1];
            }
            error_handlers[count - 1] = nullptr;
            handler_count.fetch_sub(1);
            return;
        }
    }
}

void ErrorManager::SetVerbosityLevel(ErrorVerbosityLevel level) {
    verbosity_level = level;
}

ErrorVerbosityLevel ErrorManager::GetVerbosityLevel() {
    return verbosity_level;
}

size_t ErrorManager::GetErrorHistory(ErrorInfo* buffer, size_t max_errors) {
    if (buffer == nullptr) {
        return 0;
    }

    size_t total = error_index.load();
    size_t count = std::min({total, ERROR_HISTORY_SIZE, max_errors});
    for (size_t i = 0; i < count; i++) {
        size_t idx = (total - i - 1) % ERROR_HISTORY_SIZE;
        buffer[i] = error_history[idx];
    }
    return count;
}

void ErrorManager::ClearErrorHistory() {
    error_index.store(0);
    for (auto& error : error_history) {
        error = ErrorInfo{Platform::Status::OK};
    }
}

Platform::Status ToStatus(uint32_t error_code) {
    switch (error_code & 0x00FF) {
        case ERR_INITIALIZATION:   return Platform::Status::NOT_INITIALIZED;
        case ERR_TIMEOUT:          return Platform::Status::TIMEOUT;
        case ERR_INVALID_PARAM:    return Platform::Status::INVALID_PARAM;
        case ERR_HARDWARE_FAILURE: return Platform::Status::HARDWARE_ERROR;
        case ERR_BUSY:             return Platform::Status::BUSY;
        case ERR_INVALID_STATE:    return Platform::Status::INVALID_STATE;
        case ERR_UNSUPPORTED:      return Platform::Status::NOT_SUPPORTED;
        case ERR_OVERFLOW:         return Platform::Status::BUFFER_OVERFLOW;
        case ERR_MISMATCH:         return Platform::Status::INVALID_PARAM;
        case ERR_RELEASED:         return Platform::Status::INVALID_STATE;
        default:                   return Platform::Status::ERROR;
    }
}

uint32_t FromStatus(Platform::Status status) {
    switch (status) {
        case Platform::Status::OK:              return 0;
        case Platform::Status::NOT_INITIALIZED: return ERR_INITIALIZATION;
        case Platform::Status::TIMEOUT:         return ERR_TIMEOUT;
        case Platform::Status::INVALID_PARAM:   return ERR_INVALID_PARAM;
        case Platform::Status::HARDWARE_ERROR:  return ERR_HARDWARE_FAILURE;
        case Platform::Status::BUSY:            return ERR_BUSY;
        case Platform::Status::INVALID_STATE:   return ERR_INVALID_STATE;
        case Platform::Status::NOT_SUPPORTED:   return ERR_UNSUPPORTED;
        case Platform::Status::BUFFER_OVERFLOW: return ERR_OVERFLOW;
        default:                                return ERR_HARDWARE_FAILURE;
    }
}

const char* GetErrorDescription(uint32_t error_code) {
    switch (error_code) {
        case SYSCON_INVALID_PERIPHERAL: return "SYSCON: peripheral has no clock or reset control";
        case DMA_INVALID_ENDPOINT:      return "DMA: malformed source or destination";
        case DMA_TRANSFER_TOO_LARGE:    return "DMA: transfer exceeds 1024 units";
        case DMA_UNSUPPORTED_TRANSFER:  return "DMA: unsupported transfer type";
        case DMA_CHANNEL_UNAVAILABLE:   return "DMA: channel already taken or invalid";
        case DMA_TABLE_IN_USE:          return "DMA: descriptor table already claimed";
        case DMA_CLOCK_ENABLE_FAILED:   return "DMA: could not enable peripheral clock";
        case DMA_TRANSFER_ABANDONED:    return "DMA: transfer dropped while active, channel aborted";
        case DMA_CHANNEL_MISMATCH:      return "DMA: channel used with a foreign handle or peripheral";
        case DMA_HANDLE_RELEASED:       return "DMA: handle or channel was already consumed";
        case UART_TIMEOUT:              return "USART: timeout";
        case UART_INVALID_CONFIG:       return "USART: invalid configuration";
        case UART_NOT_INITIALIZED:      return "USART: not initialized";
        case UART_RECEIVE_ERROR:        return "USART: overrun, framing, parity or noise error";
        default:
            break;
    }

    switch (error_code & 0x00FF) {
        case ERR_INITIALIZATION:   return "Initialization failed";
        case ERR_TIMEOUT:          return "Timeout";
        case ERR_INVALID_PARAM:    return "Invalid parameter";
        case ERR_HARDWARE_FAILURE: return "Hardware failure";
        case ERR_BUSY:             return "Busy";
        case ERR_INVALID_STATE:    return "Invalid state";
        case ERR_UNSUPPORTED:      return "Unsupported operation";
        case ERR_OVERFLOW:         return "Overflow";
        default:                   return "Unknown error";
    }
}
}
}
}
