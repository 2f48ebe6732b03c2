#pragma once

#include "platform.hpp"

namespace Platform {
namespace SYSCON {

#if defined(PLATFORM_LPC845)
    // SYSCON register structure (based on UM11029), clock/reset part only
    struct Registers {
        volatile uint32_t SYSMEMREMAP;     // System memory remap
        uint32_t RESERVED0[31];
        volatile uint32_t SYSAHBCLKCTRL0;  // System clock group 0 control
        volatile uint32_t SYSAHBCLKCTRL1;  // System clock group 1 control
        volatile uint32_t PRESETCTRL0;     // Peripheral reset group 0 control
        volatile uint32_t PRESETCTRL1;     // Peripheral reset group 1 control
    };

    static_assert(offsetof(Registers, SYSAHBCLKCTRL0) == 0x080, "SYSAHBCLKCTRL0 offset");
    static_assert(offsetof(Registers, PRESETCTRL0) == 0x088, "PRESETCTRL0 offset");
#else
    // SYSCON register structure (based on UM10800), clock/reset part only.
    // The manual names these SYSAHBCLKCTRL and PRESETCTRL; the 0 suffix keeps
    // the driver identical across variants.
    struct Registers {
        volatile uint32_t SYSMEMREMAP;     // System memory remap
        volatile uint32_t PRESETCTRL0;     // Peripheral reset control
        uint32_t RESERVED0[30];
        volatile uint32_t SYSAHBCLKCTRL0;  // System clock control
    };

    static_assert(offsetof(Registers, PRESETCTRL0) == 0x004, "PRESETCTRL offset");
    static_assert(offsetof(Registers, SYSAHBCLKCTRL0) == 0x080, "SYSAHBCLKCTRL offset");
#endif

    // Peripherals with a clock gate and/or reset line in SYSCON
    enum class SysconPeripheral : uint32_t {
        DMA,
        USART0,
        USART1,
        USART2,
        GPIO,
        SWM,
        IOCON
    };

    // Marks a peripheral without a dedicated reset line
    constexpr uint8_t NO_RESET_BIT = 0xFF;

    // Bit positions in SYSAHBCLKCTRL0 / PRESETCTRL0
    struct PeripheralBits {
        uint8_t clockBit;
        uint8_t resetBit;
    };

#if defined(PLATFORM_LPC845)
    constexpr PeripheralBits DMA_BITS    = {29, 29};
    constexpr PeripheralBits USART0_BITS = {14, 14};
    constexpr PeripheralBits USART1_BITS = {15, 15};
    constexpr PeripheralBits USART2_BITS = {16, 16};
    constexpr PeripheralBits GPIO_BITS   = {6, 6};
    constexpr PeripheralBits SWM_BITS    = {7, 7};
    constexpr PeripheralBits IOCON_BITS  = {18, 18};
#else
    constexpr PeripheralBits DMA_BITS    = {29, 29};
    constexpr PeripheralBits USART0_BITS = {14, 3};
    constexpr PeripheralBits USART1_BITS = {15, 4};
    constexpr PeripheralBits USART2_BITS = {16, 5};
    constexpr PeripheralBits GPIO_BITS   = {6, 10};
    constexpr PeripheralBits SWM_BITS    = {7, NO_RESET_BIT};
    constexpr PeripheralBits IOCON_BITS  = {18, NO_RESET_BIT};
#endif

    // Get SYSCON registers
    inline Registers* getSYSCONRegisters() {
        return reinterpret_cast<Registers*>(SYSCON_BASE);
    }

} // namespace SYSCON
} // namespace Platform
