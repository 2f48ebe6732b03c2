#include "hardware_abstraction/dma_endpoint.hpp"

namespace Platform {
namespace DMA {

namespace {

    Platform::Status ValidateRegion(const void* data, size_t length) {
        if (length > MAX_TRANSFER_UNITS) {
            return Platform::Status::BUFFER_OVERFLOW;
        }
        if (data == nullptr && length != 0) {
            return Platform::Status::INVALID_PARAM;
        }
        return Platform::Status::OK;
    }

    // Units minus one; an empty region never reaches the hardware
    uint16_t LastUnit(size_t length) {
        return static_cast<uint16_t>(length == 0 ? 0 : length - 1);
    }

}

// -------------------- MemorySource --------------------

MemorySource::MemorySource(const uint8_t* data, size_t length)
    : data(data), length(length) {
}

Platform::Status MemorySource::Validate() const {
    return ValidateRegion(data, length);
}

bool MemorySource::IsEmpty() const {
    return length == 0;
}

Increment MemorySource::GetIncrement() const {
    return Increment::WidthX1;
}

std::optional<uint16_t> MemorySource::TransferCount() const {
    return LastUnit(length);
}

const volatile void* MemorySource::EndAddress() const {
    return data + LastUnit(length);
}

// -------------------- MemoryDest --------------------

MemoryDest::MemoryDest(uint8_t* data, size_t length)
    : data(data), length(length) {
}

Platform::Status MemoryDest::Validate() const {
    return ValidateRegion(data, length);
}

bool MemoryDest::IsFull() const {
    return length == 0;
}

Increment MemoryDest::GetIncrement() const {
    return Increment::WidthX1;
}

std::optional<uint16_t> MemoryDest::TransferCount() const {
    return LastUnit(length);
}

volatile void* MemoryDest::EndAddress() const {
    return data + LastUnit(length);
}

// -------------------- PeripheralSource --------------------

PeripheralSource::PeripheralSource(const volatile uint32_t* reg)
    : reg(reg) {
}

Platform::Status PeripheralSource::Validate() const {
    return (reg != nullptr) ? Platform::Status::OK : Platform::Status::INVALID_PARAM;
}

bool PeripheralSource::IsEmpty() const {
    return false;
}

Increment PeripheralSource::GetIncrement() const {
    return Increment::NoIncrement;
}

std::optional<uint16_t> PeripheralSource::TransferCount() const {
    return std::nullopt;
}

const volatile void* PeripheralSource::EndAddress() const {
    return reg;
}

// -------------------- PeripheralDest --------------------

PeripheralDest::PeripheralDest(volatile uint32_t* reg)
    : reg(reg) {
}

Platform::Status PeripheralDest::Validate() const {
    return (reg != nullptr) ? Platform::Status::OK : Platform::Status::INVALID_PARAM;
}

bool PeripheralDest::IsFull() const {
    return false;
}

Increment PeripheralDest::GetIncrement() const {
    return Increment::NoIncrement;
}

std::optional<uint16_t> PeripheralDest::TransferCount() const {
    return std::nullopt;
}

volatile void* PeripheralDest::EndAddress() const {
    return reg;
}

} // namespace DMA
} // namespace Platform
