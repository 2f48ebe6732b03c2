#include <gtest/gtest.h>
#include "dma_fixture.hpp"
#include <type_traits>

using namespace Platform::DMA;
using namespace Middleware::SystemServices::ERROR;
using TestSupport::Address;
using TestSupport::Snapshot;

namespace {

template<typename C, typename = void>
struct CanStartTransfer : std::false_type {};

template<typename C>
struct CanStartTransfer<C, std::void_t<decltype(std::declval<C>().StartTransfer(
    std::declval<MemorySource>(), std::declval<PeripheralDest>()))>> : std::true_type {};

static_assert(CanStartTransfer<Channel<Platform::InitState::Enabled>>::value,
              "An enabled channel starts transfers");
static_assert(!CanStartTransfer<Channel<Platform::InitState::Disabled>>::value,
              "A disabled channel has no StartTransfer");
static_assert(!CanStartTransfer<Channel<Platform::InitState::Enabled>&>::value,
              "Starting consumes the channel");

// Reports BUSY a fixed number of times before draining
class SlowDrainDest : public PeripheralDest {
public:
    SlowDrainDest(volatile uint32_t* reg, int* calls, int busy_polls)
        : PeripheralDest(reg), calls(calls), busy_polls(busy_polls) {}

    Platform::Status Wait() override {
        return ((*calls)++ < busy_polls) ? Platform::Status::BUSY : Platform::Status::OK;
    }

private:
    int* calls;
    int busy_polls;
};

}

class DmaTransferTest : public TestSupport::DmaFixture {
protected:
    volatile uint32_t peripheral_data = 0;
    uint8_t message[10] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};
};

using DmaTransferDeathTest = DmaTransferTest;

TEST_F(DmaTransferTest, TenByteSourceProgramsDescriptorAndTriggers) {
    auto transfer = TakeEnabled(3).StartTransfer(MemorySource(message), PeripheralDest(&peripheral_data));

    EXPECT_EQ(Address(table.At(3).sourceEnd), Address(message + 9));
    EXPECT_EQ(Address(table.At(3).destEnd), Address(&peripheral_data));

    uint32_t xfercfg = dma_regs.CHANNEL[3].XFERCFG;
    EXPECT_EQ((xfercfg & getBitValue(XFERCFG::XFERCOUNT_MSK)) >> XFERCFG_XFERCOUNT_POS, 9u);

    EXPECT_EQ(dma_regs.ENABLESET0, channelFlag(3));
    EXPECT_EQ(dma_regs.SETTRIG0, channelFlag(3));
}

TEST_F(DmaTransferTest, LargestTransferFitsCountField) {
    static uint8_t largest[MAX_TRANSFER_UNITS] = {};
    auto transfer = TakeEnabled(2).StartTransfer(MemorySource(largest), PeripheralDest(&peripheral_data));

    uint32_t xfercfg = dma_regs.CHANNEL[2].XFERCFG;
    EXPECT_EQ((xfercfg & getBitValue(XFERCFG::XFERCOUNT_MSK)) >> XFERCFG_XFERCOUNT_POS, 1023u);
    EXPECT_EQ(Address(table.At(2).sourceEnd), Address(largest + MAX_TRANSFER_UNITS - 1));
    EXPECT_EQ(dma_regs.SETTRIG0, channelFlag(2));
}

TEST_F(DmaTransferTest, ConfigurationWordsMatchSingleShotByteTransfer) {
    auto transfer = TakeEnabled(5).StartTransfer(MemorySource(message), PeripheralDest(&peripheral_data));

    // Peripheral request on, hardware trigger off, priority 0
    EXPECT_EQ(dma_regs.CHANNEL[5].CFG, 0x00000001u);

    // CFGVALID, CLRTRIG, 8-bit, source +1, destination fixed, 10 units
    EXPECT_EQ(dma_regs.CHANNEL[5].XFERCFG, 0x00091009u);
}

TEST_F(DmaTransferTest, PeripheralToMemoryTakesCountFromDestination) {
    uint8_t received[4] = {};
    volatile uint32_t rx_data = 0;

    auto transfer = TakeEnabled(0).StartTransfer(PeripheralSource(&rx_data), MemoryDest(received));

    uint32_t xfercfg = dma_regs.CHANNEL[0].XFERCFG;
    EXPECT_EQ((xfercfg & getBitValue(XFERCFG::XFERCOUNT_MSK)) >> XFERCFG_XFERCOUNT_POS, 3u);
    EXPECT_EQ((xfercfg & getBitValue(XFERCFG::SRCINC_MSK)) >> XFERCFG_SRCINC_POS, 0u);
    EXPECT_EQ((xfercfg & getBitValue(XFERCFG::DSTINC_MSK)) >> XFERCFG_DSTINC_POS, 1u);
    EXPECT_EQ(Address(table.At(0).sourceEnd), Address(&rx_data));
    EXPECT_EQ(Address(table.At(0).destEnd), Address(received + 3));
}

TEST_F(DmaTransferTest, OtherChannelsAreLeftAlone) {
    constexpr uint32_t SENTINEL = 0xA5A5A5A5u;
    for (size_t i = 0; i < CHANNEL_COUNT; i++) {
        dma_regs.CHANNEL[i].CFG = SENTINEL;
        dma_regs.CHANNEL[i].XFERCFG = SENTINEL;
    }

    auto transfer = TakeEnabled(2).StartTransfer(MemorySource(message), PeripheralDest(&peripheral_data));

    for (size_t i = 0; i < CHANNEL_COUNT; i++) {
        if (i == 2) {
            continue;
        }
        EXPECT_EQ(dma_regs.CHANNEL[i].CFG, SENTINEL) << "channel " << i;
        EXPECT_EQ(dma_regs.CHANNEL[i].XFERCFG, SENTINEL) << "channel " << i;
        EXPECT_EQ(Address(table.At(i).sourceEnd), 0u) << "channel " << i;
        EXPECT_EQ(Address(table.At(i).destEnd), 0u) << "channel " << i;
    }
    EXPECT_EQ(dma_regs.ENABLESET0 & ~channelFlag(2), 0u);
    EXPECT_EQ(dma_regs.SETTRIG0 & ~channelFlag(2), 0u);
}

TEST_F(DmaTransferTest, EmptySourceSkipsHardware) {
    auto channel = TakeEnabled(4);
    std::vector<uint32_t> before = Snapshot(dma_regs);

    auto transfer = std::move(channel).StartTransfer(MemorySource(message, 0), PeripheralDest(&peripheral_data));

    EXPECT_EQ(Snapshot(dma_regs), before);
    EXPECT_EQ(Address(table.At(4).sourceEnd), 0u);
    EXPECT_TRUE(transfer.IsComplete());
    EXPECT_EQ(transfer.Poll(), Platform::Status::OK);

    auto payload = std::move(transfer).Wait();
    EXPECT_EQ(payload.channel.Index(), 4);
    EXPECT_EQ(payload.status, Platform::Status::OK);
}

TEST_F(DmaTransferTest, FullDestinationSkipsHardware) {
    volatile uint32_t rx_data = 0;
    uint8_t received[1] = {};
    auto channel = TakeEnabled(6);
    std::vector<uint32_t> before = Snapshot(dma_regs);

    auto transfer = std::move(channel).StartTransfer(PeripheralSource(&rx_data), MemoryDest(received, 0));

    EXPECT_EQ(Snapshot(dma_regs), before);
    EXPECT_TRUE(transfer.IsComplete());
}

TEST_F(DmaTransferTest, PollTracksActiveBit) {
    auto transfer = TakeEnabled(7).StartTransfer(MemorySource(message), PeripheralDest(&peripheral_data));

    dma_regs.ACTIVE0 = channelFlag(7);
    EXPECT_FALSE(transfer.IsComplete());
    EXPECT_EQ(transfer.Poll(), Platform::Status::BUSY);

    // Other channels being active does not matter
    dma_regs.ACTIVE0 = channelFlag(8);
    EXPECT_TRUE(transfer.IsComplete());
    EXPECT_EQ(transfer.Poll(), Platform::Status::OK);
}

TEST_F(DmaTransferTest, IsCompleteHasNoSideEffects) {
    auto transfer = TakeEnabled(1).StartTransfer(MemorySource(message), PeripheralDest(&peripheral_data));
    dma_regs.ACTIVE0 = channelFlag(1);

    std::vector<uint32_t> before = Snapshot(dma_regs);
    for (int i = 0; i < 3; i++) {
        EXPECT_FALSE(transfer.IsComplete());
    }
    EXPECT_EQ(Snapshot(dma_regs), before);

    dma_regs.ACTIVE0 = 0;
}

TEST_F(DmaTransferTest, WaitReturnsChannelAndEndpoints) {
    auto transfer = TakeEnabled(3).StartTransfer(MemorySource(message), PeripheralDest(&peripheral_data));

    auto payload = std::move(transfer).Wait();

    EXPECT_EQ(payload.channel.Index(), 3);
    EXPECT_EQ(Address(payload.source.Data()), Address(message));
    EXPECT_EQ(payload.source.Length(), sizeof(message));
    EXPECT_EQ(Address(payload.destination.EndAddress()), Address(&peripheral_data));
    EXPECT_EQ(payload.status, Platform::Status::OK);
}

TEST_F(DmaTransferTest, WaitBlocksUntilDestinationDrains) {
    int calls = 0;
    auto transfer = TakeEnabled(3).StartTransfer(MemorySource(message),
                                                 SlowDrainDest(&peripheral_data, &calls, 3));

    auto payload = std::move(transfer).Wait();

    EXPECT_EQ(calls, 4);
    EXPECT_EQ(payload.status, Platform::Status::OK);
}

TEST_F(DmaTransferTest, ReclaimedChannelStartsAgain) {
    auto first = TakeEnabled(9).StartTransfer(MemorySource(message), PeripheralDest(&peripheral_data));
    auto payload = std::move(first).Wait();

    dma_regs.ENABLESET0 = 0;
    dma_regs.SETTRIG0 = 0;
    auto second = std::move(payload.channel).StartTransfer(MemorySource(message, 4), PeripheralDest(&peripheral_data));

    EXPECT_EQ(Address(table.At(9).sourceEnd), Address(message + 3));
    EXPECT_EQ(dma_regs.ENABLESET0, channelFlag(9));
    EXPECT_EQ(dma_regs.SETTRIG0, channelFlag(9));
}

TEST_F(DmaTransferTest, DroppingActiveTransferAbortsChannel) {
    {
        auto transfer = TakeEnabled(5).StartTransfer(MemorySource(message), PeripheralDest(&peripheral_data));
        dma_regs.ACTIVE0 = channelFlag(5);
    }

    EXPECT_EQ(dma_regs.ENABLECLR0, channelFlag(5));
    EXPECT_EQ(dma_regs.ABORT0, channelFlag(5));
    EXPECT_TRUE(capture.recorder.Saw(DMA_TRANSFER_ABANDONED));
}

TEST_F(DmaTransferTest, DroppingFinishedTransferLeavesChannelAlone) {
    {
        auto transfer = TakeEnabled(5).StartTransfer(MemorySource(message), PeripheralDest(&peripheral_data));
    }

    EXPECT_EQ(dma_regs.ENABLECLR0, 0u);
    EXPECT_EQ(dma_regs.ABORT0, 0u);
    EXPECT_FALSE(capture.recorder.Saw(DMA_TRANSFER_ABANDONED));
}

TEST_F(DmaTransferTest, MovedTransferAbortsOnlyOnce) {
    {
        auto transfer = TakeEnabled(5).StartTransfer(MemorySource(message), PeripheralDest(&peripheral_data));
        dma_regs.ACTIVE0 = channelFlag(5);
        auto moved = std::move(transfer);
        EXPECT_EQ(moved.Poll(), Platform::Status::BUSY);
        EXPECT_EQ(moved.ChannelIndex(), 5);
    }

    EXPECT_EQ(capture.recorder.errors.size(), 1u);
    EXPECT_TRUE(capture.recorder.Saw(DMA_TRANSFER_ABANDONED));
}

TEST_F(DmaTransferDeathTest, BothEndpointsCountedIsUnsupported) {
    uint8_t received[4] = {};
    auto channel = TakeEnabled(0);

    EXPECT_DEATH({
        auto transfer = std::move(channel).StartTransfer(MemorySource(message, 4), MemoryDest(received));
    }, "unsupported transfer type");
}

TEST_F(DmaTransferDeathTest, NeitherEndpointCountedIsUnsupported) {
    volatile uint32_t rx_data = 0;
    auto channel = TakeEnabled(0);

    EXPECT_DEATH({
        auto transfer = std::move(channel).StartTransfer(PeripheralSource(&rx_data), PeripheralDest(&peripheral_data));
    }, "unsupported transfer type");
}

TEST_F(DmaTransferDeathTest, OversizedTransferAborts) {
    static uint8_t large[MAX_TRANSFER_UNITS + 1] = {};
    auto channel = TakeEnabled(0);

    EXPECT_DEATH({
        auto transfer = std::move(channel).StartTransfer(MemorySource(large), PeripheralDest(&peripheral_data));
    }, "exceeds 1024 units");
}

TEST_F(DmaTransferDeathTest, MalformedEndpointAborts) {
    auto channel = TakeEnabled(0);

    EXPECT_DEATH({
        auto transfer = std::move(channel).StartTransfer(MemorySource(nullptr, 3), PeripheralDest(&peripheral_data));
    }, "malformed source or destination");
}

TEST(DmaTransferValidationTest, OversizedSourceFailsValidationBeforeArming) {
    // The channel validates endpoints first, so this status is what stops it
    static uint8_t large[MAX_TRANSFER_UNITS + 1] = {};
    EXPECT_EQ(MemorySource(large).Validate(), Platform::Status::BUFFER_OVERFLOW);
}
