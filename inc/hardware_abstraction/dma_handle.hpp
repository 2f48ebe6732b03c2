#pragma once

#include "common/platform.hpp"
#include "common/platform_dma.hpp"
#include "common/init_state.hpp"
#include "dma_descriptors.hpp"

namespace Platform {

namespace SYSCON {
    class SysconInterface;
}

namespace DMA {

/**
 * Proof that the DMA controller is clocked, out of reset and pointed at
 * its descriptor table. Channels can only be enabled against an enabled
 * handle.
 */
template<typename State> class Handle;

template<> class Handle<InitState::Enabled>;

template<>
class Handle<InitState::Disabled> {
public:
    Handle(Handle&& other) noexcept;
    Handle& operator=(Handle&& other) noexcept;
    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    /**
     * Enable the DMA clock, release its reset, program SRAMBASE with the
     * descriptor table and set the master enable bit. A SYSCON failure is
     * fatal.
     */
    Handle<InitState::Enabled> Enable(SYSCON::SysconInterface& syscon) &&;

private:
    friend class Dma;
    friend class Handle<InitState::Enabled>;

    Handle(Registers* registers, DescriptorTable* table);

    Registers* registers;
    DescriptorTable* table;
};

/**
 * Enabled controller. Not copyable or movable: enabled channels keep a
 * pointer to it, so it must outlive all of them.
 */
template<>
class Handle<InitState::Enabled> {
public:
    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;
    Handle(Handle&&) = delete;
    Handle& operator=(Handle&&) = delete;

    // Clear the master enable bit and gate the DMA clock
    Handle<InitState::Disabled> Disable(SYSCON::SysconInterface& syscon) &&;

    Registers* GetRegisters() const { return registers; }

private:
    friend class Handle<InitState::Disabled>;

    Handle(Registers* registers, DescriptorTable* table);

    Registers* registers;
    DescriptorTable* table;
};

} // namespace DMA
} // namespace Platform
