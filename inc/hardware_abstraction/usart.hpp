#pragma once

#include "hw_interface.hpp"
#include "syscon.hpp"
#include "dma_channel.hpp"
#include "dma_endpoint.hpp"
#include "common/platform.hpp"
#include "common/platform_usart.hpp"
#include "common/platform_syscon.hpp"
#include "common/init_state.hpp"

namespace Platform {
namespace USART {

// Baud rate dividers are computed by the caller for the chosen clock
struct UsartConfig {
    UsartInstance instance;
    uint32_t brg_value;        // BRG.BRGVAL, baud = clock / ((OSR + 1) * (BRG + 1))
    uint32_t osr_value;        // OSR.OSRVAL, 4..15
    DataLength data_length;
    Parity parity;
    StopBits stop_bits;
};

/**
 * Transmit data register as a DMA destination. Drained once the shift
 * register has sent the last byte (TXIDLE).
 */
class UsartTxEndpoint : public DMA::PeripheralDest {
public:
    explicit UsartTxEndpoint(Registers* registers);

    Platform::Status Wait() override;

private:
    Registers* registers;
};

// Receive data register as a DMA source
class UsartRxEndpoint : public DMA::PeripheralSource {
public:
    explicit UsartRxEndpoint(Registers* registers);
};

class UsartInterface : public HwInterface {
private:
    UsartInstance instance;
    Registers* registers;
    SYSCON::SysconInterface& syscon;
    bool initialized;
    UsartConfig config;

    SYSCON::SysconPeripheral GetSysconPeripheral() const;
    Platform::Status WaitForFlag(Flag flag, uint32_t timeout);
    Platform::Status CheckReceiveErrors();

public:
    UsartInterface(UsartInstance instance, Registers* registers, SYSCON::SysconInterface& syscon);
    ~UsartInterface() override;

    // Interface implementation
    Platform::Status Init(void* config) override;
    Platform::Status DeInit() override;
    Platform::Status Control(uint32_t command, void* param) override;

    // Polled transfers. A timeout of 0 checks the flag once.
    Platform::Status Read(void* buffer, uint16_t size, uint32_t timeout) override;
    Platform::Status Write(const void* data, uint16_t size, uint32_t timeout) override;
    Platform::Status RegisterCallback(uint32_t eventId, void (*callback)(void* param), void* param) override;

    // USART-specific methods
    bool IsFlagSet(Flag flag) const;
    Platform::Status ClearFlag(Flag flag);
    bool IsInitialized() const { return initialized; }

    UsartTxEndpoint TxEndpoint() const;
    UsartRxEndpoint RxEndpoint() const;

    /**
     * Send `source` through TXDAT. The channel must be the instance's TX
     * request channel (2n + 1) and the USART must be initialized; anything
     * else is fatal.
     */
    DMA::Transfer<DMA::MemorySource, UsartTxEndpoint> StartDmaWrite(
        DMA::Channel<InitState::Enabled>&& channel, DMA::MemorySource source);

    // Fill `destination` from RXDAT on the RX request channel (2n)
    DMA::Transfer<UsartRxEndpoint, DMA::MemoryDest> StartDmaRead(
        DMA::Channel<InitState::Enabled>&& channel, DMA::MemoryDest destination);

    static UsartInterface& GetInstance(UsartInstance instance);
};

// USART control command identifiers
constexpr uint32_t USART_CTRL_ENABLE_TX = 0x0401;     // param unused
constexpr uint32_t USART_CTRL_DISABLE_TX = 0x0402;    // param unused
constexpr uint32_t USART_CTRL_CLEAR_FLAG = 0x0403;    // param is Flag*
constexpr uint32_t USART_CTRL_GET_STATUS = 0x0404;    // param is uint32_t*, receives STAT

}
}
