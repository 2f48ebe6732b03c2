#pragma once

#include "common/platform.hpp"
#include "common/platform_dma.hpp"
#include "common/init_state.hpp"
#include "dma_descriptors.hpp"
#include "dma_endpoint.hpp"
#include "dma_handle.hpp"
#include <atomic>
#include <type_traits>
#include <utility>

namespace Platform {
namespace DMA {

/**
 * Identity and register access shared by every channel state.
 *
 * Move-only; a moved-from core no longer refers to a channel.
 */
class ChannelCore {
public:
    ChannelCore(uint8_t index, ChannelDescriptor* descriptor, Registers* registers);
    ChannelCore(ChannelCore&& other) noexcept;
    ChannelCore& operator=(ChannelCore&& other) noexcept;
    ChannelCore(const ChannelCore&) = delete;
    ChannelCore& operator=(const ChannelCore&) = delete;

    uint8_t Index() const { return index; }
    uint32_t Flag() const { return channelFlag(index); }
    Registers* GetRegisters() const { return registers; }
    bool IsValid() const { return registers != nullptr && descriptor != nullptr; }

    // Channel bit in ACTIVE0
    bool IsActive() const;

    /**
     * Program and trigger a single-shot transfer.
     *
     * Both endpoints are validated first; a malformed or oversized endpoint
     * is fatal, as is a pair that does not have exactly one transfer count.
     *
     * @return false if the source is empty or the destination full, in which
     *         case no register was written
     */
    bool Arm(const Source& source, const Dest& destination);

    // Stop a transfer that is still running and report it
    void Abandon();

private:
    uint8_t index;
    ChannelDescriptor* descriptor;
    Registers* registers;
};

template<typename State> class Channel;
template<> class Channel<InitState::Enabled>;
template<typename S, typename D> class Transfer;

template<>
class Channel<InitState::Disabled> {
public:
    Channel(Channel&&) noexcept = default;
    Channel& operator=(Channel&&) noexcept = default;

    /**
     * Tag the channel as usable. Writes no registers; the handle already
     * guarantees the controller is running and must outlive the result.
     */
    Channel<InitState::Enabled> Enable(const Handle<InitState::Enabled>& handle) &&;

    // The channel keeps a pointer to the handle, a temporary would dangle
    Channel<InitState::Enabled> Enable(const Handle<InitState::Enabled>&& handle) && = delete;

    uint8_t Index() const { return core.Index(); }
    uint32_t Flag() const { return core.Flag(); }

private:
    friend class Channels;

    explicit Channel(ChannelCore core) : core(std::move(core)) {}

    ChannelCore core;
};

template<>
class Channel<InitState::Enabled> {
public:
    Channel(Channel&&) noexcept = default;
    Channel& operator=(Channel&&) noexcept = default;

    /**
     * Start moving bytes from `source` to `destination`.
     *
     * The channel and both endpoints are owned by the returned Transfer until
     * it is waited on. Fatal if the handle was disabled since the channel was
     * enabled. See ChannelCore::Arm for the other fatal cases.
     */
    template<typename S, typename D>
    Transfer<S, D> StartTransfer(S source, D destination) &&;

    uint8_t Index() const { return core.Index(); }
    uint32_t Flag() const { return core.Flag(); }
    bool IsActive() const { return core.IsActive(); }

    const Handle<InitState::Enabled>& GetHandle() const { return *handle; }

private:
    friend class Channel<InitState::Disabled>;
    template<typename S, typename D> friend class Transfer;

    Channel(ChannelCore core, const Handle<InitState::Enabled>* handle)
        : core(std::move(core)), handle(handle) {}

    // Fatal once the handle has been disabled
    void CheckHandle() const;

    ChannelCore core;
    const Handle<InitState::Enabled>* handle;
};

// Everything a finished transfer hands back
template<typename S, typename D>
struct Payload {
    Channel<InitState::Enabled> channel;
    S source;
    D destination;
    Platform::Status status;   // Result of the destination drain
};

/**
 * An armed (or zero-length) transfer. Holds the channel and both endpoints
 * so the buffers cannot be reused while the controller may still access them.
 *
 * Destroying a transfer whose channel is still active stops the channel and
 * logs DMA_TRANSFER_ABANDONED.
 */
template<typename S, typename D>
class Transfer {
    static_assert(std::is_base_of<Source, S>::value, "S must derive from DMA::Source");
    static_assert(std::is_base_of<Dest, D>::value, "D must derive from DMA::Dest");

public:
    Transfer(Transfer&& other) noexcept
        : channel(std::move(other.channel)),
          source(std::move(other.source)),
          destination(std::move(other.destination)),
          started(other.started),
          finished(other.finished) {
        other.started = false;
    }

    Transfer& operator=(Transfer&&) = delete;
    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    ~Transfer() {
        if (started && !finished && channel.core.IsValid() && channel.core.IsActive()) {
            channel.core.Abandon();
        }
    }

    // Pure read of ACTIVE0; a zero-length transfer is always complete
    bool IsComplete() const {
        return !started || !channel.core.IsActive();
    }

    Platform::Status Poll() const {
        return IsComplete() ? Platform::Status::OK : Platform::Status::BUSY;
    }

    /**
     * Block until the channel is inactive and the destination has drained,
     * then give back the channel and the endpoints.
     */
    Payload<S, D> Wait() && {
        while (!IsComplete()) {
        }

        Platform::Status status;
        while ((status = destination.Wait()) == Platform::Status::BUSY) {
        }

        // Buffer reads after this point must observe the controller's writes
        std::atomic_thread_fence(std::memory_order_seq_cst);

        finished = true;
        return Payload<S, D>{std::move(channel), std::move(source), std::move(destination), status};
    }

    uint8_t ChannelIndex() const { return channel.Index(); }

private:
    friend class Channel<InitState::Enabled>;

    Transfer(Channel<InitState::Enabled>&& channel, S source, D destination, bool started)
        : channel(std::move(channel)),
          source(std::move(source)),
          destination(std::move(destination)),
          started(started),
          finished(false) {}

    Channel<InitState::Enabled> channel;
    S source;
    D destination;
    bool started;
    bool finished;
};

template<typename S, typename D>
Transfer<S, D> Channel<InitState::Enabled>::StartTransfer(S source, D destination) && {
    static_assert(std::is_base_of<Source, S>::value, "S must derive from DMA::Source");
    static_assert(std::is_base_of<Dest, D>::value, "D must derive from DMA::Dest");

    CheckHandle();
    bool started = core.Arm(source, destination);
    return Transfer<S, D>(std::move(*this), std::move(source), std::move(destination), started);
}

} // namespace DMA
} // namespace Platform
