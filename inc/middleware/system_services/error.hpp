#pragma once

#include "common/platform.hpp"
#include <array>
#include <atomic>

namespace Middleware {
namespace SystemServices {
    namespace ERROR {

        constexpr uint8_t MAX_ERROR_HANDLERS = 5;
        constexpr size_t ERROR_HISTORY_SIZE = 32;  // Adjust based on memory constraints

        enum class ErrorVerbosityLevel {
            Debug,      // All errors with full context
            Normal,     // Important errors with context
            Critical,   // Only critical system errors
            None        // Logging disabled
        };
        struct ErrorInfo {
            Platform::Status status_code;    // Basic error code
            uint32_t module_id;              // Identifies the subsystem (e.g., DMA, USART)
            uint32_t error_id;               // Module-specific error identifier
            const char* location;            // File where error occurred
            uint32_t line;                   // Line number
            uint64_t timestamp;              // When the error occurred
            uint32_t additional_info;        // Error-specific context data
        };
        class IErrorHandler {
            public:
                virtual ~IErrorHandler() = default;

                virtual void HandleError(const ErrorInfo& error) = 0;

                // Filter to determine if this handler should process the error
                virtual bool ShouldHandleError(const ErrorInfo& error) = 0;
            };

        class ErrorManager {
            private:
                static std::array<ErrorInfo, ERROR_HISTORY_SIZE> error_history;
                static std::atomic<size_t> error_index;
                static std::array<IErrorHandler*, MAX_ERROR_HANDLERS> error_handlers;
                static std::atomic<size_t> handler_count;
                static ErrorVerbosityLevel verbosity_level;

                static void Record(const ErrorInfo& error);
                static void Dispatch(const ErrorInfo& error);

            public:


                // Core logging function
                static void LogError(const ErrorInfo& error);

                /**
                 * Record a contract violation, notify every handler regardless
                 * of the verbosity level, then abort. Used where continuing
                 * would let hardware act on an invalid configuration.
                 */
                [[noreturn]] static void ReportFatal(const ErrorInfo& error);

                // Get current timestamp
                static uint64_t GetTimestamp();

                // Register handler for different error processing
                static void RegisterErrorHandler(IErrorHandler* handler);

                // Remove a previously registered handler
                static void UnregisterErrorHandler(IErrorHandler* handler);

                // Set verbosity level
                static void SetVerbosityLevel(ErrorVerbosityLevel level);
                static ErrorVerbosityLevel GetVerbosityLevel();

                // Retrieve recent errors, newest first
                static size_t GetErrorHistory(ErrorInfo* buffer, size_t max_errors);

                // Clear error history
                static void ClearErrorHistory();
            };


                // Module IDs
        constexpr uint32_t MODULE_HAL = 0x1000;
        constexpr uint32_t MODULE_MIDDLEWARE = 0x2000;
        constexpr uint32_t MODULE_APPLICATION = 0x4000;

        // Specific module sub-ranges
        constexpr uint32_t MODULE_GPIO = MODULE_HAL | 0x0100;
        constexpr uint32_t MODULE_SYSCON = MODULE_HAL | 0x0200;
        constexpr uint32_t MODULE_DMA = MODULE_HAL | 0x0300;
        constexpr uint32_t MODULE_UART = MODULE_HAL | 0x0400;

        constexpr uint32_t MODULE_SYSTEM_TIMING = MODULE_MIDDLEWARE | 0x0100;
        constexpr uint32_t MODULE_APPLICATION_MAIN = MODULE_APPLICATION | 0x0100;


        // Common error patterns within modules
        constexpr uint32_t ERR_INITIALIZATION = 0x0001;
        constexpr uint32_t ERR_TIMEOUT = 0x0002;
        constexpr uint32_t ERR_INVALID_PARAM = 0x0003;
        constexpr uint32_t ERR_HARDWARE_FAILURE = 0x0004;
        constexpr uint32_t ERR_BUSY = 0x0005;
        constexpr uint32_t ERR_INVALID_STATE = 0x0006;
        constexpr uint32_t ERR_UNSUPPORTED = 0x0007;
        constexpr uint32_t ERR_OVERFLOW = 0x0008;
        constexpr uint32_t ERR_ABANDONED = 0x0009;
        constexpr uint32_t ERR_MISMATCH = 0x000A;
        constexpr uint32_t ERR_RELEASED = 0x000B;

        // Combined error codes
        constexpr uint32_t SYSCON_INVALID_PERIPHERAL = MODULE_SYSCON | ERR_INVALID_PARAM;

        constexpr uint32_t DMA_INVALID_ENDPOINT = MODULE_DMA | ERR_INVALID_PARAM;
        constexpr uint32_t DMA_TRANSFER_TOO_LARGE = MODULE_DMA | ERR_OVERFLOW;
        constexpr uint32_t DMA_UNSUPPORTED_TRANSFER = MODULE_DMA | ERR_UNSUPPORTED;
        constexpr uint32_t DMA_CHANNEL_UNAVAILABLE = MODULE_DMA | ERR_INVALID_STATE;
        constexpr uint32_t DMA_TABLE_IN_USE = MODULE_DMA | ERR_BUSY;
        constexpr uint32_t DMA_CLOCK_ENABLE_FAILED = MODULE_DMA | ERR_INITIALIZATION;
        constexpr uint32_t DMA_TRANSFER_ABANDONED = MODULE_DMA | ERR_ABANDONED;
        constexpr uint32_t DMA_CHANNEL_MISMATCH = MODULE_DMA | ERR_MISMATCH;
        constexpr uint32_t DMA_HANDLE_RELEASED = MODULE_DMA | ERR_RELEASED;

        constexpr uint32_t UART_TIMEOUT = MODULE_UART | ERR_TIMEOUT;
        constexpr uint32_t UART_INVALID_CONFIG = MODULE_UART | ERR_INVALID_PARAM;
        constexpr uint32_t UART_NOT_INITIALIZED = MODULE_UART | ERR_INVALID_STATE;
        constexpr uint32_t UART_RECEIVE_ERROR = MODULE_UART | ERR_HARDWARE_FAILURE;

        // Conversion to Status values
        Platform::Status ToStatus(uint32_t error_code);
        uint32_t FromStatus(Platform::Status status);

        // Error descriptions
        const char* GetErrorDescription(uint32_t error_code);

        #define ERROR_LOG(module_id, error_id, status) \
            ::Middleware::SystemServices::ERROR::ErrorManager::LogError({ \
                (status), \
                (module_id), \
                (error_id), \
                __FILE__, \
                __LINE__, \
                ::Middleware::SystemServices::ERROR::ErrorManager::GetTimestamp(), \
                0 \
            })

        #define ERROR_LOG_WITH_INFO(module_id, error_id, status, info) \
            ::Middleware::SystemServices::ERROR::ErrorManager::LogError({ \
                (status), \
                (module_id), \
                (error_id), \
                __FILE__, \
                __LINE__, \
                ::Middleware::SystemServices::ERROR::ErrorManager::GetTimestamp(), \
                static_cast<uint32_t>(info) \
            })

        #define ERROR_FATAL(module_id, error_id, status, info) \
            ::Middleware::SystemServices::ERROR::ErrorManager::ReportFatal({ \
                (status), \
                (module_id), \
                (error_id), \
                __FILE__, \
                __LINE__, \
                ::Middleware::SystemServices::ERROR::ErrorManager::GetTimestamp(), \
                static_cast<uint32_t>(info) \
            })

        #define RETURN_IF_ERROR(module_id, expr) \
            do { \
                Platform::Status status_ = (expr); \
                if (status_ != Platform::Status::OK) { \
                    ERROR_LOG((module_id), (module_id) | ::Middleware::SystemServices::ERROR::FromStatus(status_), status_); \
                    return status_; \
                } \
            } while(0)

}
}
}
