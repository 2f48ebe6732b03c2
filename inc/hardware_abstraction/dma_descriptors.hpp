#pragma once

#include "common/platform.hpp"
#include "common/platform_dma.hpp"
#include <array>

namespace Platform {
namespace DMA {

class Dma;
class Channels;
template<typename State> class Handle;

/**
 * Channel descriptor as read by the controller.
 *
 * Only the two end addresses are written by this driver. The configuration
 * and link words are reserved for reload transfers and stay zero.
 */
struct alignas(16) ChannelDescriptor {
    volatile uint32_t config;                 // Reserved
    const volatile void* volatile sourceEnd;  // Last source address
    volatile void* volatile destEnd;          // Last destination address
    const ChannelDescriptor* volatile nextDesc; // Link to the next descriptor, unused
};

static_assert(sizeof(void*) != 4 || sizeof(ChannelDescriptor) == 16,
              "Descriptor layout must match the controller");

/**
 * One descriptor per channel, in channel index order. SRAMBASE requires a
 * 512 byte aligned table. The controller keeps its address, so the table
 * must live for the rest of the program and never move.
 */
class alignas(512) DescriptorTable {
public:
    DescriptorTable() : descriptors{}, claimed(false) {}

    DescriptorTable(const DescriptorTable&) = delete;
    DescriptorTable& operator=(const DescriptorTable&) = delete;
    DescriptorTable(DescriptorTable&&) = delete;
    DescriptorTable& operator=(DescriptorTable&&) = delete;

    static constexpr size_t Size() { return CHANNEL_COUNT; }

    // Read-only view of a slot, for diagnostics
    const ChannelDescriptor& At(size_t index) const { return descriptors.at(index); }

private:
    friend class Dma;
    friend class Channels;
    template<typename State> friend class Handle;

    ChannelDescriptor& Descriptor(size_t index) { return descriptors[index]; }

    // Value written to SRAMBASE
    uint32_t BaseAddress() const {
        return static_cast<uint32_t>(reinterpret_cast<uintptr_t>(descriptors.data()));
    }

    std::array<ChannelDescriptor, CHANNEL_COUNT> descriptors;
    bool claimed;
};

} // namespace DMA
} // namespace Platform
