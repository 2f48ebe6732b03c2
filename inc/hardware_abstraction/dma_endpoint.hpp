#pragma once

#include "common/platform.hpp"
#include "common/platform_dma.hpp"
#include <optional>

namespace Platform {
namespace DMA {

/**
 * Supplies the bytes of a transfer.
 *
 * Implementations are views: copying or moving one must not change the
 * address returned by EndAddress(), so a Transfer may keep them by value.
 */
class Source {
public:
    virtual ~Source() = default;

    // OK, BUFFER_OVERFLOW (more than MAX_TRANSFER_UNITS) or INVALID_PARAM
    virtual Platform::Status Validate() const = 0;

    // True if there is nothing left to read
    virtual bool IsEmpty() const = 0;

    virtual Increment GetIncrement() const = 0;

    // Number of transfer units minus one, empty for an open-ended peripheral
    virtual std::optional<uint16_t> TransferCount() const = 0;

    // Address of the last unit read by the controller
    virtual const volatile void* EndAddress() const = 0;
};

/**
 * Receives the bytes of a transfer. Same view contract as Source.
 */
class Dest {
public:
    virtual ~Dest() = default;

    virtual Platform::Status Validate() const = 0;

    // True if there is no room left to write
    virtual bool IsFull() const = 0;

    virtual Increment GetIncrement() const = 0;

    virtual std::optional<uint16_t> TransferCount() const = 0;

    // Address of the last unit written by the controller
    virtual volatile void* EndAddress() const = 0;

    /**
     * Called once the channel is no longer active.
     *
     * @return OK once the destination has drained, BUSY while it is still
     *         emitting data, or an error status
     */
    virtual Platform::Status Wait() { return Platform::Status::OK; }
};

// Read-only byte region, typically a constant message
class MemorySource : public Source {
public:
    MemorySource(const uint8_t* data, size_t length);

    template<size_t N>
    explicit MemorySource(const uint8_t (&data)[N]) : MemorySource(data, N) {}

    Platform::Status Validate() const override;
    bool IsEmpty() const override;
    Increment GetIncrement() const override;
    std::optional<uint16_t> TransferCount() const override;
    const volatile void* EndAddress() const override;

    const uint8_t* Data() const { return data; }
    size_t Length() const { return length; }

private:
    const uint8_t* data;
    size_t length;
};

// Writable byte region
class MemoryDest : public Dest {
public:
    MemoryDest(uint8_t* data, size_t length);

    template<size_t N>
    explicit MemoryDest(uint8_t (&data)[N]) : MemoryDest(data, N) {}

    Platform::Status Validate() const override;
    bool IsFull() const override;
    Increment GetIncrement() const override;
    std::optional<uint16_t> TransferCount() const override;
    volatile void* EndAddress() const override;

    uint8_t* Data() const { return data; }
    size_t Length() const { return length; }

private:
    uint8_t* data;
    size_t length;
};

// Fixed peripheral register read once per request
class PeripheralSource : public Source {
public:
    explicit PeripheralSource(const volatile uint32_t* reg);

    Platform::Status Validate() const override;
    bool IsEmpty() const override;
    Increment GetIncrement() const override;
    std::optional<uint16_t> TransferCount() const override;
    const volatile void* EndAddress() const override;

private:
    const volatile uint32_t* reg;
};

// Fixed peripheral register written once per request
class PeripheralDest : public Dest {
public:
    explicit PeripheralDest(volatile uint32_t* reg);

    Platform::Status Validate() const override;
    bool IsFull() const override;
    Increment GetIncrement() const override;
    std::optional<uint16_t> TransferCount() const override;
    volatile void* EndAddress() const override;

private:
    volatile uint32_t* reg;
};

} // namespace DMA
} // namespace Platform
