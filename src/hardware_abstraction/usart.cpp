#include "hardware_abstraction/usart.hpp"
#include "system_services/error.hpp"
#include "system_services/system_timing.hpp"
#include <utility>

using namespace Middleware::SystemServices::ERROR;

namespace Platform {
namespace USART {

constexpr size_t USART_INSTANCE_COUNT = 3;

// Errors reported by the receiver alongside a character
constexpr uint32_t RECEIVE_ERROR_FLAGS =
    getBitValue(Flag::OVERRUN) | getBitValue(Flag::FRAMERR) |
    getBitValue(Flag::PARITYERR) | getBitValue(Flag::RXNOISE);

// -------------------- DMA endpoints --------------------

UsartTxEndpoint::UsartTxEndpoint(Registers* registers)
    : DMA::PeripheralDest(registers != nullptr ? &registers->TXDAT : nullptr),
      registers(registers) {
}

Platform::Status UsartTxEndpoint::Wait() {
    if (registers == nullptr) {
        return Platform::Status::INVALID_PARAM;
    }
    return (readReg(registers->STAT) & getBitValue(Flag::TXIDLE)) != 0
        ? Platform::Status::OK
        : Platform::Status::BUSY;
}

UsartRxEndpoint::UsartRxEndpoint(Registers* registers)
    : DMA::PeripheralSource(registers != nullptr ? &registers->RXDAT : nullptr) {
}

// -------------------- UsartInterface --------------------

UsartInterface::UsartInterface(UsartInstance instance, Registers* registers, SYSCON::SysconInterface& syscon)
    : instance(instance),
      registers(registers),
      syscon(syscon),
      initialized(false),
      config() {
}

UsartInterface::~UsartInterface() {
    if (initialized) {
        DeInit();
    }
}

UsartInterface& UsartInterface::GetInstance(UsartInstance instance) {
    SYSCON::SysconInterface& syscon = SYSCON::SysconInterface::GetInstance();

    // static array of actual instances
    static UsartInterface instances[USART_INSTANCE_COUNT] = {
        UsartInterface(UsartInstance::USART0, getUsart(UsartInstance::USART0), syscon),
        UsartInterface(UsartInstance::USART1, getUsart(UsartInstance::USART1), syscon),
        UsartInterface(UsartInstance::USART2, getUsart(UsartInstance::USART2), syscon)
    };

    size_t index = static_cast<size_t>(instance);
    if (index >= USART_INSTANCE_COUNT) {
        // Since we can't return nullptr with references, default to USART0
        index = 0;
    }
    return instances[index];
}

SYSCON::SysconPeripheral UsartInterface::GetSysconPeripheral() const {
    switch (instance) {
        case UsartInstance::USART1: return SYSCON::SysconPeripheral::USART1;
        case UsartInstance::USART2: return SYSCON::SysconPeripheral::USART2;
        case UsartInstance::USART0:
        default:                    return SYSCON::SysconPeripheral::USART0;
    }
}

Platform::Status UsartInterface::Init(void* config) {
    if (config == nullptr || registers == nullptr) {
        ERROR_LOG(MODULE_UART, UART_INVALID_CONFIG, Platform::Status::INVALID_PARAM);
        return Platform::Status::INVALID_PARAM;
    }

    UsartConfig* usart_config = static_cast<UsartConfig*>(config);

    if (usart_config->instance != instance ||
        usart_config->brg_value > BRG_BRGVAL_MSK ||
        usart_config->osr_value < 4 ||
        usart_config->osr_value > OSR_OSRVAL_MSK) {
        ERROR_LOG(MODULE_UART, UART_INVALID_CONFIG, Platform::Status::INVALID_PARAM);
        return Platform::Status::INVALID_PARAM;
    }

    SYSCON::SysconPeripheral peripheral = GetSysconPeripheral();
    RETURN_IF_ERROR(MODULE_UART, syscon.EnablePeripheralClock(peripheral));
    RETURN_IF_ERROR(MODULE_UART, syscon.ClearPeripheralReset(peripheral));

    // Configuration registers may only change while the USART is disabled
    writeReg(registers->CFG, 0);
    writeReg(registers->BRG, usart_config->brg_value);
    writeReg(registers->OSR, usart_config->osr_value);
    writeReg(registers->CTL, 0);

    uint32_t cfg = static_cast<uint32_t>(usart_config->data_length) |
                   static_cast<uint32_t>(usart_config->parity) |
                   static_cast<uint32_t>(usart_config->stop_bits);
    writeReg(registers->CFG, cfg);
    setBit(registers->CFG, getBitValue(CFG::ENABLE));

    this->config = *usart_config;
    initialized = true;
    return Platform::Status::OK;
}

Platform::Status UsartInterface::DeInit() {
    if (!initialized) {
        return Platform::Status::OK;
    }

    clearBit(registers->CFG, getBitValue(CFG::ENABLE));

    SYSCON::SysconPeripheral peripheral = GetSysconPeripheral();
    RETURN_IF_ERROR(MODULE_UART, syscon.AssertPeripheralReset(peripheral));
    RETURN_IF_ERROR(MODULE_UART, syscon.DisablePeripheralClock(peripheral));

    initialized = false;
    return Platform::Status::OK;
}

Platform::Status UsartInterface::Control(uint32_t command, void* param) {
    if (!initialized) {
        return Platform::Status::NOT_INITIALIZED;
    }

    switch (command) {
        case USART_CTRL_ENABLE_TX:
            clearBit(registers->CTL, getBitValue(CTL::TXDIS));
            return Platform::Status::OK;

        case USART_CTRL_DISABLE_TX:
            setBit(registers->CTL, getBitValue(CTL::TXDIS));
            return Platform::Status::OK;

        case USART_CTRL_CLEAR_FLAG: {
            if (param == nullptr) {
                return Platform::Status::INVALID_PARAM;
            }
            return ClearFlag(*static_cast<Flag*>(param));
        }

        case USART_CTRL_GET_STATUS: {
            if (param == nullptr) {
                return Platform::Status::INVALID_PARAM;
            }
            *static_cast<uint32_t*>(param) = readReg(registers->STAT);
            return Platform::Status::OK;
        }

        default:
            return Platform::Status::NOT_SUPPORTED;
    }
}

Platform::Status UsartInterface::WaitForFlag(Flag flag, uint32_t timeout) {
    auto& timing = Middleware::SystemServices::SystemTiming::GetInstance();
    uint64_t start = timing.GetMilliseconds();

    while (!IsFlagSet(flag)) {
        if (timeout == 0 || timing.HasElapsed(start, timeout)) {
            ERROR_LOG_WITH_INFO(MODULE_UART, UART_TIMEOUT, Platform::Status::TIMEOUT, getBitValue(flag));
            return Platform::Status::TIMEOUT;
        }
    }
    return Platform::Status::OK;
}

Platform::Status UsartInterface::CheckReceiveErrors() {
    uint32_t errors = readReg(registers->STAT) & RECEIVE_ERROR_FLAGS;
    if (errors == 0) {
        return Platform::Status::OK;
    }

    // All receive error flags are write-one-to-clear
    writeReg(registers->STAT, errors);
    ERROR_LOG_WITH_INFO(MODULE_UART, UART_RECEIVE_ERROR,
                        Platform::Status::COMMUNICATION_ERROR, errors);
    return Platform::Status::COMMUNICATION_ERROR;
}

Platform::Status UsartInterface::Read(void* buffer, uint16_t size, uint32_t timeout) {
    if (!initialized) {
        ERROR_LOG(MODULE_UART, UART_NOT_INITIALIZED, Platform::Status::NOT_INITIALIZED);
        return Platform::Status::NOT_INITIALIZED;
    }
    if (buffer == nullptr || size == 0) {
        return Platform::Status::INVALID_PARAM;
    }

    uint8_t* bytes = static_cast<uint8_t*>(buffer);
    for (uint16_t i = 0; i < size; i++) {
        Platform::Status status = WaitForFlag(Flag::RXRDY, timeout);
        if (status != Platform::Status::OK) {
            return status;
        }

        status = CheckReceiveErrors();
        if (status != Platform::Status::OK) {
            return status;
        }

        bytes[i] = static_cast<uint8_t>(readReg(registers->RXDAT) & 0xFFU);
    }
    return Platform::Status::OK;
}

Platform::Status UsartInterface::Write(const void* data, uint16_t size, uint32_t timeout) {
    if (!initialized) {
        ERROR_LOG(MODULE_UART, UART_NOT_INITIALIZED, Platform::Status::NOT_INITIALIZED);
        return Platform::Status::NOT_INITIALIZED;
    }
    if (data == nullptr || size == 0) {
        return Platform::Status::INVALID_PARAM;
    }

    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    for (uint16_t i = 0; i < size; i++) {
        Platform::Status status = WaitForFlag(Flag::TXRDY, timeout);
        if (status != Platform::Status::OK) {
            return status;
        }
        writeReg(registers->TXDAT, bytes[i]);
    }
    return Platform::Status::OK;
}

Platform::Status UsartInterface::RegisterCallback(uint32_t eventId, void (*callback)(void* param), void* param) {
    // Interrupt-driven operation is not provided
    return Platform::Status::NOT_SUPPORTED;
}

bool UsartInterface::IsFlagSet(Flag flag) const {
    return (readReg(registers->STAT) & getBitValue(flag)) != 0;
}

Platform::Status UsartInterface::ClearFlag(Flag flag) {
    if (!isWriteOneToClear(flag)) {
        return Platform::Status::INVALID_PARAM;
    }
    writeReg(registers->STAT, getBitValue(flag));
    return Platform::Status::OK;
}

UsartTxEndpoint UsartInterface::TxEndpoint() const {
    return UsartTxEndpoint(registers);
}

UsartRxEndpoint UsartInterface::RxEndpoint() const {
    return UsartRxEndpoint(registers);
}

DMA::Transfer<DMA::MemorySource, UsartTxEndpoint> UsartInterface::StartDmaWrite(
    DMA::Channel<InitState::Enabled>&& channel, DMA::MemorySource source) {
    if (channel.Index() != txDmaChannel(instance)) {
        ERROR_FATAL(MODULE_UART, DMA_CHANNEL_MISMATCH, Platform::Status::INVALID_PARAM, channel.Index());
    }
    if (!initialized) {
        ERROR_FATAL(MODULE_UART, UART_NOT_INITIALIZED, Platform::Status::NOT_INITIALIZED, channel.Index());
    }
    return std::move(channel).StartTransfer(std::move(source), TxEndpoint());
}

DMA::Transfer<UsartRxEndpoint, DMA::MemoryDest> UsartInterface::StartDmaRead(
    DMA::Channel<InitState::Enabled>&& channel, DMA::MemoryDest destination) {
    if (channel.Index() != rxDmaChannel(instance)) {
        ERROR_FATAL(MODULE_UART, DMA_CHANNEL_MISMATCH, Platform::Status::INVALID_PARAM, channel.Index());
    }
    if (!initialized) {
        ERROR_FATAL(MODULE_UART, UART_NOT_INITIALIZED, Platform::Status::NOT_INITIALIZED, channel.Index());
    }
    return std::move(channel).StartTransfer(RxEndpoint(), std::move(destination));
}

}
}
