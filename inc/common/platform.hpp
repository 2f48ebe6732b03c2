#pragma once

#include <cstdint>
#include <cstddef>
#include <unordered_map>

// Forward declarations for standard C libraries
extern "C" {
    #include <stdio.h>
    #include <stdlib.h>
}

#if !defined(PLATFORM_LPC82X) && !defined(PLATFORM_LPC845)
#define PLATFORM_LPC82X
#endif

namespace Platform {

// -------------------- Type Definitions --------------------

// Status codes
enum class Status {
    OK = 0,              // Operation completed successfully
    ERROR,               // Generic error
    BUSY,                // Resource is busy
    TIMEOUT,             // Operation timed out
    INVALID_PARAM,       // Invalid parameter
    NOT_SUPPORTED,       // Operation not supported
    RESOURCE_ERROR,      // Resource allocation error
    NOT_INITIALIZED,     // Component not initialized
    INVALID_STATE,       // Component in invalid state for operation
    NO_DATA,             // No data available
    BUFFER_OVERFLOW,     // Buffer overflow
    HARDWARE_ERROR,      // Hardware-specific error
    COMMUNICATION_ERROR  // Communication error
};

// -------------------- Clock Definitions --------------------

constexpr uint32_t IRC_CLOCK = 12000000U;  // Internal RC oscillator in Hz
constexpr uint32_t MCU_CLK = IRC_CLOCK;     // Main clock after reset

// -------------------- Memory Map Base Addresses --------------------

// APB peripherals
constexpr uintptr_t APBPERIPH_BASE = 0x40000000UL;
constexpr uintptr_t SYSCON_BASE = (APBPERIPH_BASE + 0x00048000UL);
constexpr uintptr_t USART0_BASE = (APBPERIPH_BASE + 0x00064000UL);
constexpr uintptr_t USART1_BASE = (APBPERIPH_BASE + 0x00068000UL);
constexpr uintptr_t USART2_BASE = (APBPERIPH_BASE + 0x0006C000UL);

// AHB peripherals
constexpr uintptr_t AHBPERIPH_BASE = 0x50000000UL;
constexpr uintptr_t DMA0_BASE = (AHBPERIPH_BASE + 0x00008000UL);

// -------------------- Utility Functions --------------------

// Generic bit manipulation templates
template<typename RegType, typename BitType>
inline void setBit(volatile RegType& reg, BitType bit) {
    reg |= static_cast<RegType>(bit);
}

template<typename RegType, typename BitType>
inline void clearBit(volatile RegType& reg, BitType bit) {
    reg &= ~static_cast<RegType>(bit);
}

template<typename T>
inline bool isBitSet(const volatile T& reg, T bit) {
    return (reg & bit) != 0;
}

template<typename T, typename U>
inline void writeReg(volatile T& reg, U val) {
    reg = static_cast<T>(val);
}

template<typename T>
inline T readReg(const volatile T& reg) {
    return reg;
}

template<typename T, typename U, typename V>
inline void modifyReg(volatile T& reg, U clearMask, V setMask) {
    reg = (reg & (~static_cast<T>(clearMask))) | static_cast<T>(setMask);
}

} // namespace Platform
