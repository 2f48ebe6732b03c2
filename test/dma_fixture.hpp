// dma_fixture.hpp
#pragma once

#include <gtest/gtest.h>
#include "hardware_abstraction/dma.hpp"
#include "hardware_abstraction/syscon.hpp"
#include "test_support.hpp"
#include <utility>
#include <vector>

namespace TestSupport {

inline uintptr_t Address(const volatile void* pointer) {
    return reinterpret_cast<uintptr_t>(pointer);
}

// Every word of a register block, for before/after comparisons
template<typename RegisterBlock>
std::vector<uint32_t> Snapshot(const RegisterBlock& block) {
    const volatile uint32_t* words = reinterpret_cast<const volatile uint32_t*>(&block);
    std::vector<uint32_t> copy(sizeof(RegisterBlock) / sizeof(uint32_t));
    for (size_t i = 0; i < copy.size(); i++) {
        copy[i] = words[i];
    }
    return copy;
}

/**
 * DMA controller and SYSCON backed by zeroed RAM, split and enabled.
 */
class DmaFixture : public ::testing::Test {
protected:
    using Enabled = Platform::InitState::Enabled;
    using Disabled = Platform::InitState::Disabled;

    Platform::DMA::Registers dma_regs{};
    Platform::SYSCON::Registers syscon_regs{};
    Platform::SYSCON::SysconInterface syscon{&syscon_regs};
    Platform::DMA::DescriptorTable table;
    Platform::DMA::Parts parts = Platform::DMA::Dma::Split(table, &dma_regs);
    Platform::DMA::Handle<Enabled> handle = std::move(parts.handle).Enable(syscon);
    ErrorCapture capture;

    Platform::DMA::Channel<Enabled> TakeEnabled(size_t index) {
        return parts.channels.Take(index).Enable(handle);
    }
};

} // namespace TestSupport
