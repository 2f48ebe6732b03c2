#pragma once

#include "hw_interface.hpp"
#include "common/platform.hpp"
#include "common/platform_syscon.hpp"

namespace Platform {
namespace SYSCON {

/**
 * SYSCON clock gating and peripheral reset control.
 *
 * Clock source selection and divider setup stay at their reset defaults.
 */
class SysconInterface : public HwInterface {
private:
    Registers* registers;
    bool initialized;

    Platform::Status LookupBits(SysconPeripheral peripheral, PeripheralBits& bits) const;

public:
    explicit SysconInterface(Registers* registers = getSYSCONRegisters());
    ~SysconInterface() override = default;

    // Interface implementation
    Platform::Status Init(void* config) override;
    Platform::Status DeInit() override;
    Platform::Status Control(uint32_t command, void* param) override;
    Platform::Status Read(void* buffer, uint16_t size, uint32_t timeout) override;
    Platform::Status Write(const void* data, uint16_t size, uint32_t timeout) override;
    Platform::Status RegisterCallback(uint32_t eventId, void (*callback)(void* param), void* param) override;

    // SYSCON-specific methods
    Platform::Status EnablePeripheralClock(SysconPeripheral peripheral);
    Platform::Status DisablePeripheralClock(SysconPeripheral peripheral);
    Platform::Status IsPeripheralClockEnabled(SysconPeripheral peripheral, bool& enabled) const;

    // NOT_SUPPORTED for peripherals without a reset line
    Platform::Status AssertPeripheralReset(SysconPeripheral peripheral);
    Platform::Status ClearPeripheralReset(SysconPeripheral peripheral);

    static SysconInterface& GetInstance();
};

// SYSCON control command identifiers, param is a SysconPeripheral*
constexpr uint32_t SYSCON_CTRL_ENABLE_CLOCK = 0x0201;
constexpr uint32_t SYSCON_CTRL_DISABLE_CLOCK = 0x0202;
constexpr uint32_t SYSCON_CTRL_ASSERT_RESET = 0x0203;
constexpr uint32_t SYSCON_CTRL_CLEAR_RESET = 0x0204;

}
}
