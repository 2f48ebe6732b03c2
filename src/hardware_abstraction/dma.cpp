#include "hardware_abstraction/dma.hpp"
#include "hardware_abstraction/syscon.hpp"
#include "system_services/error.hpp"

using namespace Middleware::SystemServices::ERROR;

namespace Platform {
namespace DMA {

// -------------------- Handle --------------------

Handle<InitState::Disabled>::Handle(Registers* registers, DescriptorTable* table)
    : registers(registers), table(table) {
}

Handle<InitState::Disabled>::Handle(Handle&& other) noexcept
    : registers(other.registers), table(other.table) {
    other.registers = nullptr;
    other.table = nullptr;
}

Handle<InitState::Disabled>& Handle<InitState::Disabled>::operator=(Handle&& other) noexcept {
    if (this != &other) {
        registers = other.registers;
        table = other.table;
        other.registers = nullptr;
        other.table = nullptr;
    }
    return *this;
}

Handle<InitState::Enabled> Handle<InitState::Disabled>::Enable(SYSCON::SysconInterface& syscon) && {
    if (registers == nullptr || table == nullptr) {
        ERROR_FATAL(MODULE_DMA, DMA_HANDLE_RELEASED, Platform::Status::INVALID_STATE, 0);
    }

    Platform::Status status = syscon.EnablePeripheralClock(SYSCON::SysconPeripheral::DMA);
    if (status != Platform::Status::OK) {
        ERROR_FATAL(MODULE_DMA, DMA_CLOCK_ENABLE_FAILED, status, 0);
    }

    status = syscon.ClearPeripheralReset(SYSCON::SysconPeripheral::DMA);
    if (status != Platform::Status::OK) {
        ERROR_FATAL(MODULE_DMA, DMA_CLOCK_ENABLE_FAILED, status, 1);
    }

    writeReg(registers->SRAMBASE, table->BaseAddress());
    setBit(registers->CTRL, getBitValue(CTRL::ENABLE));

    Registers* enabledRegisters = registers;
    DescriptorTable* enabledTable = table;
    registers = nullptr;
    table = nullptr;
    return Handle<InitState::Enabled>(enabledRegisters, enabledTable);
}

Handle<InitState::Enabled>::Handle(Registers* registers, DescriptorTable* table)
    : registers(registers), table(table) {
}

Handle<InitState::Disabled> Handle<InitState::Enabled>::Disable(SYSCON::SysconInterface& syscon) && {
    if (registers == nullptr || table == nullptr) {
        ERROR_FATAL(MODULE_DMA, DMA_HANDLE_RELEASED, Platform::Status::INVALID_STATE, 0);
    }

    clearBit(registers->CTRL, getBitValue(CTRL::ENABLE));

    Platform::Status status = syscon.DisablePeripheralClock(SYSCON::SysconPeripheral::DMA);
    if (status != Platform::Status::OK) {
        ERROR_LOG(MODULE_DMA, DMA_CLOCK_ENABLE_FAILED, status);
    }

    Registers* disabledRegisters = registers;
    DescriptorTable* disabledTable = table;
    registers = nullptr;
    table = nullptr;
    return Handle<InitState::Disabled>(disabledRegisters, disabledTable);
}

// -------------------- Channels --------------------

Channels::Channels(DescriptorTable& table, Registers* registers)
    : table(&table), registers(registers), taken(0) {
    static_assert(DescriptorTable::Size() == CHANNEL_COUNT, "One descriptor per channel");
    static_assert(CHANNEL_COUNT <= 32, "Channel bits must fit the shared registers");
}

Channels::Channels(Channels&& other) noexcept
    : table(other.table), registers(other.registers), taken(other.taken) {
    other.table = nullptr;
    other.registers = nullptr;
    other.taken = 0;
}

Channels& Channels::operator=(Channels&& other) noexcept {
    if (this != &other) {
        table = other.table;
        registers = other.registers;
        taken = other.taken;
        other.table = nullptr;
        other.registers = nullptr;
        other.taken = 0;
    }
    return *this;
}

Channel<InitState::Disabled> Channels::Take(size_t index) {
    if (table == nullptr || index >= CHANNEL_COUNT) {
        ERROR_FATAL(MODULE_DMA, DMA_CHANNEL_UNAVAILABLE, Platform::Status::INVALID_PARAM, index);
    }
    if (!IsAvailable(index)) {
        ERROR_FATAL(MODULE_DMA, DMA_CHANNEL_UNAVAILABLE, Platform::Status::INVALID_STATE, index);
    }

    taken |= channelFlag(static_cast<uint8_t>(index));
    return Channel<InitState::Disabled>(
        ChannelCore(static_cast<uint8_t>(index), &table->Descriptor(index), registers));
}

bool Channels::IsAvailable(size_t index) const {
    if (table == nullptr || index >= CHANNEL_COUNT) {
        return false;
    }
    return (taken & channelFlag(static_cast<uint8_t>(index))) == 0;
}

// -------------------- Dma --------------------

Parts Dma::Split(DescriptorTable& table, Registers* registers) {
    if (table.claimed) {
        ERROR_FATAL(MODULE_DMA, DMA_TABLE_IN_USE, Platform::Status::INVALID_STATE, 0);
    }
    table.claimed = true;

    return Parts{Handle<InitState::Disabled>(registers, &table), Channels(table, registers)};
}

} // namespace DMA
} // namespace Platform
