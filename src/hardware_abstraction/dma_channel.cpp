#include "hardware_abstraction/dma_channel.hpp"
#include "system_services/error.hpp"

using namespace Middleware::SystemServices::ERROR;

namespace Platform {
namespace DMA {

namespace {

    void CheckEndpoint(Platform::Status status, uint8_t index) {
        switch (status) {
            case Platform::Status::OK:
                return;
            case Platform::Status::BUFFER_OVERFLOW:
                ERROR_FATAL(MODULE_DMA, DMA_TRANSFER_TOO_LARGE, status, index);
            default:
                ERROR_FATAL(MODULE_DMA, DMA_INVALID_ENDPOINT, status, index);
        }
    }

}

ChannelCore::ChannelCore(uint8_t index, ChannelDescriptor* descriptor, Registers* registers)
    : index(index), descriptor(descriptor), registers(registers) {
}

ChannelCore::ChannelCore(ChannelCore&& other) noexcept
    : index(other.index), descriptor(other.descriptor), registers(other.registers) {
    other.descriptor = nullptr;
    other.registers = nullptr;
}

ChannelCore& ChannelCore::operator=(ChannelCore&& other) noexcept {
    if (this != &other) {
        index = other.index;
        descriptor = other.descriptor;
        registers = other.registers;
        other.descriptor = nullptr;
        other.registers = nullptr;
    }
    return *this;
}

bool ChannelCore::IsActive() const {
    if (registers == nullptr) {
        return false;
    }
    return (readReg(registers->ACTIVE0) & Flag()) != 0;
}

bool ChannelCore::Arm(const Source& source, const Dest& destination) {
    if (!IsValid()) {
        ERROR_FATAL(MODULE_DMA, DMA_HANDLE_RELEASED, Platform::Status::INVALID_STATE, index);
    }

    CheckEndpoint(source.Validate(), index);
    CheckEndpoint(destination.Validate(), index);

    // Writes to the buffers must land before the controller learns their address
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (source.IsEmpty() || destination.IsFull()) {
        return false;
    }

    std::optional<uint16_t> sourceCount = source.TransferCount();
    std::optional<uint16_t> destinationCount = destination.TransferCount();

    uint16_t count = 0;
    if (sourceCount.has_value() && !destinationCount.has_value()) {
        count = *sourceCount;
    } else if (!sourceCount.has_value() && destinationCount.has_value()) {
        count = *destinationCount;
    } else {
        ERROR_FATAL(MODULE_DMA, DMA_UNSUPPORTED_TRANSFER, Platform::Status::NOT_SUPPORTED, index);
    }

    DMA_Channel& channel = registers->CHANNEL[index];

    // Peripheral request enabled, hardware trigger disabled, highest priority
    writeReg(channel.CFG, getBitValue(CFG::PERIPHREQEN) | channelPriority(0));

    // Single store: the controller latches CFGVALID together with the rest
    uint32_t xfercfg = getBitValue(XFERCFG::CFGVALID | XFERCFG::CLRTRIG | XFERCFG::WIDTH_8BIT) |
                       sourceIncrement(source.GetIncrement()) |
                       destinationIncrement(destination.GetIncrement()) |
                       transferCount(count);
    writeReg(channel.XFERCFG, xfercfg);

    descriptor->sourceEnd = source.EndAddress();
    descriptor->destEnd = destination.EndAddress();

    // Write-one-to-set registers, other channels' bits are unaffected
    writeReg(registers->ENABLESET0, Flag());
    writeReg(registers->SETTRIG0, Flag());

    return true;
}

void ChannelCore::Abandon() {
    writeReg(registers->ENABLECLR0, Flag());
    while ((readReg(registers->BUSY0) & Flag()) != 0) {
    }
    writeReg(registers->ABORT0, Flag());

    ERROR_LOG_WITH_INFO(MODULE_DMA, DMA_TRANSFER_ABANDONED, Platform::Status::INVALID_STATE, index);
}

Channel<InitState::Enabled> Channel<InitState::Disabled>::Enable(const Handle<InitState::Enabled>& handle) && {
    if (!core.IsValid()) {
        ERROR_FATAL(MODULE_DMA, DMA_HANDLE_RELEASED, Platform::Status::INVALID_STATE, core.Index());
    }
    if (handle.GetRegisters() != core.GetRegisters()) {
        ERROR_FATAL(MODULE_DMA, DMA_CHANNEL_MISMATCH, Platform::Status::INVALID_PARAM, core.Index());
    }
    return Channel<InitState::Enabled>(std::move(core), &handle);
}

void Channel<InitState::Enabled>::CheckHandle() const {
    if (handle == nullptr || handle->GetRegisters() == nullptr) {
        ERROR_FATAL(MODULE_DMA, DMA_HANDLE_RELEASED, Platform::Status::INVALID_STATE, core.Index());
    }
}

} // namespace DMA
} // namespace Platform
