#pragma once

#include "common/platform.hpp"
#include "common/platform_dma.hpp"
#include "common/init_state.hpp"
#include "dma_descriptors.hpp"
#include "dma_endpoint.hpp"
#include "dma_handle.hpp"
#include "dma_channel.hpp"

/**
 * DMA controller driver.
 *
 * Typical use:
 *
 *   static DescriptorTable table;
 *   auto parts = Dma::Split(table);
 *   auto handle = std::move(parts.handle).Enable(syscon);
 *   auto channel = parts.channels.Take(1).Enable(handle);
 *   auto transfer = std::move(channel).StartTransfer(source, destination);
 *   auto payload = std::move(transfer).Wait();
 */
namespace Platform {
namespace DMA {

/**
 * All channels of the chip, each handed out once, in the Disabled state.
 */
class Channels {
public:
    Channels(Channels&& other) noexcept;
    Channels& operator=(Channels&& other) noexcept;
    Channels(const Channels&) = delete;
    Channels& operator=(const Channels&) = delete;

    // Fatal if the index is out of range or the channel was already taken
    Channel<InitState::Disabled> Take(size_t index);

    template<size_t Index>
    Channel<InitState::Disabled> Take() {
        static_assert(Index < CHANNEL_COUNT, "No such DMA channel on this chip");
        return Take(Index);
    }

    bool IsAvailable(size_t index) const;

    static constexpr size_t Count() { return CHANNEL_COUNT; }

private:
    friend class Dma;

    Channels(DescriptorTable& table, Registers* registers);

    DescriptorTable* table;
    Registers* registers;
    uint32_t taken;   // One bit per channel
};

struct Parts {
    Handle<InitState::Disabled> handle;
    Channels channels;
};

class Dma {
public:
    /**
     * Claim the descriptor table and split the controller into its handle
     * and channels. A table can be claimed once; a second claim is fatal.
     */
    static Parts Split(DescriptorTable& table, Registers* registers = getDMA0Registers());
};

} // namespace DMA
} // namespace Platform
