#pragma once


#include "platform.hpp"
#include <cstddef>



namespace Platform {

    namespace DMA {

        // Number of hardware channels on the selected chip variant
#if defined(PLATFORM_LPC845)
        constexpr size_t CHANNEL_COUNT = 25;
#else
        constexpr size_t CHANNEL_COUNT = 18;
#endif

        // XFERCOUNT is 10 bits wide and holds "units - 1"
        constexpr uint32_t MAX_TRANSFER_UNITS = 1024;

        // DMA channel register structure
        struct DMA_Channel {
            volatile uint32_t CFG;          // Channel configuration register
            volatile uint32_t CTLSTAT;      // Channel control and status register
            volatile uint32_t XFERCFG;      // Channel transfer configuration register
            uint32_t RESERVED;
        };

        // DMA register structure
        struct Registers {
            volatile uint32_t CTRL;          // DMA control register
            volatile uint32_t INTSTAT;       // Interrupt status register
            volatile uint32_t SRAMBASE;      // SRAM address of the channel descriptor table
            uint32_t RESERVED0[5];
            volatile uint32_t ENABLESET0;    // Channel enable read and set (one bit per channel)
            uint32_t RESERVED1;
            volatile uint32_t ENABLECLR0;    // Channel enable clear
            uint32_t RESERVED2;
            volatile uint32_t ACTIVE0;       // Channel active status
            uint32_t RESERVED3;
            volatile uint32_t BUSY0;         // Channel busy status
            uint32_t RESERVED4;
            volatile uint32_t ERRINT0;       // Error interrupt status
            uint32_t RESERVED5;
            volatile uint32_t INTENSET0;     // Interrupt enable read and set
            uint32_t RESERVED6;
            volatile uint32_t INTENCLR0;     // Interrupt enable clear
            uint32_t RESERVED7;
            volatile uint32_t INTA0;         // Interrupt A status
            uint32_t RESERVED8;
            volatile uint32_t INTB0;         // Interrupt B status
            uint32_t RESERVED9;
            volatile uint32_t SETVALID0;     // Set configuration valid
            uint32_t RESERVED10;
            volatile uint32_t SETTRIG0;      // Set software trigger
            uint32_t RESERVED11;
            volatile uint32_t ABORT0;        // Channel abort
            uint32_t RESERVED12[225];
            DMA_Channel CHANNEL[CHANNEL_COUNT];
        };

        static_assert(offsetof(Registers, SRAMBASE) == 0x008, "SRAMBASE offset");
        static_assert(offsetof(Registers, ENABLESET0) == 0x020, "ENABLESET0 offset");
        static_assert(offsetof(Registers, ACTIVE0) == 0x030, "ACTIVE0 offset");
        static_assert(offsetof(Registers, BUSY0) == 0x038, "BUSY0 offset");
        static_assert(offsetof(Registers, SETTRIG0) == 0x070, "SETTRIG0 offset");
        static_assert(offsetof(Registers, ABORT0) == 0x078, "ABORT0 offset");
        static_assert(offsetof(Registers, CHANNEL) == 0x400, "Channel block offset");
        static_assert(sizeof(DMA_Channel) == 0x10, "Channel block stride");

        // CTRL register bits
        enum class CTRL : uint32_t {
            ENABLE = (1UL << 0)           // DMA controller master enable
        };

        // Channel CFG register bits
        enum class CFG : uint32_t {
            PERIPHREQEN = (1UL << 0),     // Peripheral request enable
            HWTRIGEN = (1UL << 1),        // Hardware triggering enable
            TRIGPOL = (1UL << 4),         // Trigger polarity: active high / rising edge
            TRIGTYPE = (1UL << 5),        // Trigger type: level sensitive
            TRIGBURST = (1UL << 6),       // Trigger burst
            BURSTPOWER_MSK = (0xFUL << 8),// Burst size is 2^BURSTPOWER
            SRCBURSTWRAP = (1UL << 14),   // Source burst wrap
            DSTBURSTWRAP = (1UL << 15),   // Destination burst wrap
            CHPRIORITY_MSK = (0x7UL << 16)// Channel priority, 0 is highest
        };

        constexpr uint32_t CFG_CHPRIORITY_POS = 16;

        // Channel CTLSTAT register bits
        enum class CTLSTAT : uint32_t {
            VALIDPENDING = (1UL << 0),    // Valid pending flag
            TRIG = (1UL << 2)             // Trigger flag
        };

        // Channel XFERCFG register bits
        enum class XFERCFG : uint32_t {
            CFGVALID = (1UL << 0),        // Configuration valid
            RELOAD = (1UL << 1),          // Reload channel configuration from the linked descriptor
            SWTRIG = (1UL << 2),          // Software trigger
            CLRTRIG = (1UL << 3),         // Clear trigger when the descriptor is exhausted
            SETINTA = (1UL << 4),         // Set interrupt flag A on exhaustion
            SETINTB = (1UL << 5),         // Set interrupt flag B on exhaustion
            WIDTH_8BIT = (0UL << 8),      // Transfer width: 8-bit
            WIDTH_16BIT = (1UL << 8),     // Transfer width: 16-bit
            WIDTH_32BIT = (2UL << 8),     // Transfer width: 32-bit
            WIDTH_MSK = (3UL << 8),       // Transfer width mask
            SRCINC_MSK = (3UL << 12),     // Source address increment mask
            DSTINC_MSK = (3UL << 14),     // Destination address increment mask
            XFERCOUNT_MSK = (0x3FFUL << 16) // Transfer count mask
        };

        constexpr uint32_t XFERCFG_SRCINC_POS = 12;
        constexpr uint32_t XFERCFG_DSTINC_POS = 14;
        constexpr uint32_t XFERCFG_XFERCOUNT_POS = 16;

        // Address increment applied after each transfer unit
        enum class Increment : uint32_t {
            NoIncrement = 0,   // Fixed address, e.g. a peripheral data register
            WidthX1 = 1,       // Increment by one transfer width
            WidthX2 = 2,       // Increment by two transfer widths
            WidthX4 = 3        // Increment by four transfer widths
        };

        // Get DMA registers
        inline Registers* getDMA0Registers() {
            return reinterpret_cast<Registers*>(DMA0_BASE);
        }

        // Helper functions for bit manipulation
        constexpr uint32_t getBitValue(CTRL bit) {
            return static_cast<uint32_t>(bit);
        }

        constexpr uint32_t getBitValue(CFG bit) {
            return static_cast<uint32_t>(bit);
        }

        constexpr uint32_t getBitValue(XFERCFG bit) {
            return static_cast<uint32_t>(bit);
        }

        constexpr uint32_t getBitValue(Increment increment) {
            return static_cast<uint32_t>(increment);
        }

        // Operator overloads for combining flags
        constexpr CFG operator|(CFG a, CFG b) {
            return static_cast<CFG>(
                static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
        }

        constexpr XFERCFG operator|(XFERCFG a, XFERCFG b) {
            return static_cast<XFERCFG>(
                static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
        }

        // Field encoders for the multi-bit XFERCFG and CFG fields
        constexpr uint32_t sourceIncrement(Increment increment) {
            return getBitValue(increment) << XFERCFG_SRCINC_POS;
        }

        constexpr uint32_t destinationIncrement(Increment increment) {
            return getBitValue(increment) << XFERCFG_DSTINC_POS;
        }

        constexpr uint32_t transferCount(uint32_t count) {
            return (count << XFERCFG_XFERCOUNT_POS) & getBitValue(XFERCFG::XFERCOUNT_MSK);
        }

        constexpr uint32_t channelPriority(uint32_t priority) {
            return (priority << CFG_CHPRIORITY_POS) & getBitValue(CFG::CHPRIORITY_MSK);
        }

        // Bit owned by a channel in the shared ENABLESET0/ACTIVE0/SETTRIG0/... registers
        constexpr uint32_t channelFlag(uint8_t index) {
            return 1UL << index;
        }
    }
}
