#include <gtest/gtest.h>
#include "dma_fixture.hpp"

using namespace Platform::DMA;
using namespace Middleware::SystemServices::ERROR;
using Platform::SYSCON::DMA_BITS;
using TestSupport::Address;

class DmaHandleTest : public TestSupport::DmaFixture {};

using DmaHandleDeathTest = DmaHandleTest;

TEST_F(DmaHandleTest, EnableClocksAndReleasesController) {
    EXPECT_NE(syscon_regs.SYSAHBCLKCTRL0 & (1UL << DMA_BITS.clockBit), 0u);
    EXPECT_NE(syscon_regs.PRESETCTRL0 & (1UL << DMA_BITS.resetBit), 0u);
    EXPECT_EQ(dma_regs.CTRL & getBitValue(CTRL::ENABLE), getBitValue(CTRL::ENABLE));
}

TEST_F(DmaHandleTest, SrambasePointsAtDescriptorTable) {
    uintptr_t base = Address(&table.At(0));

    EXPECT_EQ(base % 512, 0u);
    EXPECT_EQ(dma_regs.SRAMBASE, static_cast<uint32_t>(base));
    EXPECT_EQ(Address(&table.At(1)) - base, sizeof(ChannelDescriptor));
}

TEST_F(DmaHandleTest, EnabledHandleExposesItsController) {
    EXPECT_EQ(handle.GetRegisters(), &dma_regs);
}

TEST_F(DmaHandleTest, DisableStopsControllerAndGatesClock) {
    Registers other_regs{};
    Platform::SYSCON::Registers other_syscon_regs{};
    Platform::SYSCON::SysconInterface other_syscon{&other_syscon_regs};
    DescriptorTable other_table;

    Parts other = Dma::Split(other_table, &other_regs);
    Handle<Platform::InitState::Enabled> enabled = std::move(other.handle).Enable(other_syscon);
    ASSERT_NE(other_regs.CTRL, 0u);

    Handle<Platform::InitState::Disabled> disabled = std::move(enabled).Disable(other_syscon);

    EXPECT_EQ(other_regs.CTRL & getBitValue(CTRL::ENABLE), 0u);
    EXPECT_EQ(other_syscon_regs.SYSAHBCLKCTRL0 & (1UL << DMA_BITS.clockBit), 0u);

    // A disabled handle can be enabled again
    Handle<Platform::InitState::Enabled> again = std::move(disabled).Enable(other_syscon);
    EXPECT_NE(other_regs.CTRL & getBitValue(CTRL::ENABLE), 0u);
}

TEST_F(DmaHandleTest, DescriptorTableIsAligned) {
    static_assert(alignof(DescriptorTable) == 512, "SRAMBASE alignment");
    static_assert(DescriptorTable::Size() == CHANNEL_COUNT, "One slot per channel");
    EXPECT_EQ(Address(&table) % 512, 0u);
}

TEST_F(DmaHandleDeathTest, SecondSplitOfTheSameTableAborts) {
    EXPECT_DEATH({
        Parts again = Dma::Split(table, &dma_regs);
    }, "descriptor table already claimed");
}

TEST_F(DmaHandleDeathTest, ReusedDisabledHandleAborts) {
    // parts.handle was consumed by the fixture
    EXPECT_DEATH({
        auto enabled = std::move(parts.handle).Enable(syscon);
    }, "handle or channel was already consumed");
}

TEST_F(DmaHandleDeathTest, ChannelOfAnotherControllerAborts) {
    Registers other_regs{};
    DescriptorTable other_table;
    Parts other = Dma::Split(other_table, &other_regs);

    EXPECT_DEATH({
        auto channel = other.channels.Take(0).Enable(handle);
    }, "foreign handle or peripheral");
}

TEST_F(DmaHandleDeathTest, TransferAfterHandleDisabledAborts) {
    Registers other_regs{};
    Platform::SYSCON::Registers other_syscon_regs{};
    Platform::SYSCON::SysconInterface other_syscon{&other_syscon_regs};
    DescriptorTable other_table;
    volatile uint32_t peripheral_data = 0;
    uint8_t message[4] = {'a', 'b', 'c', 'd'};

    Parts other = Dma::Split(other_table, &other_regs);
    Handle<Platform::InitState::Enabled> enabled = std::move(other.handle).Enable(other_syscon);
    Channel<Platform::InitState::Enabled> channel = other.channels.Take(3).Enable(enabled);

    Handle<Platform::InitState::Disabled> disabled = std::move(enabled).Disable(other_syscon);
    ASSERT_EQ(other_regs.CTRL & getBitValue(CTRL::ENABLE), 0u);

    EXPECT_DEATH({
        auto transfer = std::move(channel).StartTransfer(MemorySource(message), PeripheralDest(&peripheral_data));
    }, "handle or channel was already consumed");

    // Nothing was armed on the stopped controller
    EXPECT_EQ(other_regs.SETTRIG0, 0u);
    EXPECT_EQ(other_regs.CHANNEL[3].XFERCFG, 0u);
}
