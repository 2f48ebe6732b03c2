// syscon.cpp
#include "hardware_abstraction/syscon.hpp"
#include "common/platform.hpp"
#include "common/platform_syscon.hpp"
#include "system_services/error.hpp"
#include <unordered_map>

using namespace Middleware::SystemServices::ERROR;

namespace Platform {
namespace SYSCON {

static const std::unordered_map<SysconPeripheral, PeripheralBits> peripheralMap = {
    {SysconPeripheral::DMA,    DMA_BITS},
    {SysconPeripheral::USART0, USART0_BITS},
    {SysconPeripheral::USART1, USART1_BITS},
    {SysconPeripheral::USART2, USART2_BITS},
    {SysconPeripheral::GPIO,   GPIO_BITS},
    {SysconPeripheral::SWM,    SWM_BITS},
    {SysconPeripheral::IOCON,  IOCON_BITS}
};

SysconInterface::SysconInterface(Registers* registers)
    : registers(registers),
      initialized(false) {
}

SysconInterface& SysconInterface::GetInstance() {
    static SysconInterface instance;
    return instance;
}

Platform::Status SysconInterface::LookupBits(SysconPeripheral peripheral, PeripheralBits& bits) const {
    auto it = peripheralMap.find(peripheral);
    if (it == peripheralMap.end()) {
        ERROR_LOG_WITH_INFO(MODULE_SYSCON, SYSCON_INVALID_PERIPHERAL,
                            Platform::Status::INVALID_PARAM, static_cast<uint32_t>(peripheral));
        return Platform::Status::INVALID_PARAM;
    }
    bits = it->second;
    return Platform::Status::OK;
}

Platform::Status SysconInterface::Init(void* config) {
    if (registers == nullptr) {
        return Platform::Status::INVALID_PARAM;
    }
    // Nothing to configure: the main clock stays on the internal oscillator
    initialized = true;
    return Platform::Status::OK;
}

Platform::Status SysconInterface::DeInit() {
    initialized = false;
    return Platform::Status::OK;
}

Platform::Status SysconInterface::Control(uint32_t command, void* param) {
    if (param == nullptr) {
        return Platform::Status::INVALID_PARAM;
    }

    SysconPeripheral peripheral = *static_cast<SysconPeripheral*>(param);

    switch (command) {
        case SYSCON_CTRL_ENABLE_CLOCK:
            return EnablePeripheralClock(peripheral);
        case SYSCON_CTRL_DISABLE_CLOCK:
            return DisablePeripheralClock(peripheral);
        case SYSCON_CTRL_ASSERT_RESET:
            return AssertPeripheralReset(peripheral);
        case SYSCON_CTRL_CLEAR_RESET:
            return ClearPeripheralReset(peripheral);
        default:
            return Platform::Status::NOT_SUPPORTED;
    }
}

Platform::Status SysconInterface::Read(void* buffer, uint16_t size, uint32_t timeout) {
    // Direct Read operation not used for SYSCON
    return Platform::Status::NOT_SUPPORTED;
}

Platform::Status SysconInterface::Write(const void* data, uint16_t size, uint32_t timeout) {
    // Direct Write operation not used for SYSCON
    return Platform::Status::NOT_SUPPORTED;
}

Platform::Status SysconInterface::RegisterCallback(uint32_t eventId, void (*callback)(void* param), void* param) {
    return Platform::Status::NOT_SUPPORTED;
}

Platform::Status SysconInterface::EnablePeripheralClock(SysconPeripheral peripheral) {
    PeripheralBits bits;
    Platform::Status status = LookupBits(peripheral, bits);
    if (status != Platform::Status::OK) {
        return status;
    }

    Platform::setBit(registers->SYSAHBCLKCTRL0, (1UL << bits.clockBit));
    return Platform::Status::OK;
}

Platform::Status SysconInterface::DisablePeripheralClock(SysconPeripheral peripheral) {
    PeripheralBits bits;
    Platform::Status status = LookupBits(peripheral, bits);
    if (status != Platform::Status::OK) {
        return status;
    }

    Platform::clearBit(registers->SYSAHBCLKCTRL0, (1UL << bits.clockBit));
    return Platform::Status::OK;
}

Platform::Status SysconInterface::IsPeripheralClockEnabled(SysconPeripheral peripheral, bool& enabled) const {
    // Initialize output parameter to a safe value
    enabled = false;

    PeripheralBits bits;
    Platform::Status status = LookupBits(peripheral, bits);
    if (status != Platform::Status::OK) {
        return status;
    }

    enabled = (Platform::readReg(registers->SYSAHBCLKCTRL0) & (1UL << bits.clockBit)) != 0;
    return Platform::Status::OK;
}

// PRESETCTRL bits are active low: 0 holds the peripheral in reset
Platform::Status SysconInterface::AssertPeripheralReset(SysconPeripheral peripheral) {
    PeripheralBits bits;
    Platform::Status status = LookupBits(peripheral, bits);
    if (status != Platform::Status::OK) {
        return status;
    }
    if (bits.resetBit == NO_RESET_BIT) {
        return Platform::Status::NOT_SUPPORTED;
    }

    Platform::clearBit(registers->PRESETCTRL0, (1UL << bits.resetBit));
    return Platform::Status::OK;
}

Platform::Status SysconInterface::ClearPeripheralReset(SysconPeripheral peripheral) {
    PeripheralBits bits;
    Platform::Status status = LookupBits(peripheral, bits);
    if (status != Platform::Status::OK) {
        return status;
    }
    if (bits.resetBit == NO_RESET_BIT) {
        return Platform::Status::NOT_SUPPORTED;
    }

    Platform::setBit(registers->PRESETCTRL0, (1UL << bits.resetBit));
    return Platform::Status::OK;
}

}
}
