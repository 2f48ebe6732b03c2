#pragma once

#include "platform.hpp"

namespace Platform {
    namespace USART {

        // USART register structure
        struct Registers {
            volatile uint32_t CFG;        // Configuration register
            volatile uint32_t CTL;        // Control register
            volatile uint32_t STAT;       // Status register
            volatile uint32_t INTENSET;   // Interrupt enable read and set
            volatile uint32_t INTENCLR;   // Interrupt enable clear
            volatile uint32_t RXDAT;      // Receiver data
            volatile uint32_t RXDATSTAT;  // Receiver data with status
            volatile uint32_t TXDAT;      // Transmit data
            volatile uint32_t BRG;        // Baud rate generator
            volatile uint32_t INTSTAT;    // Interrupt status
            volatile uint32_t OSR;        // Oversample selection
            volatile uint32_t ADDR;       // Address register for automatic address matching
        };

        static_assert(offsetof(Registers, RXDAT) == 0x14, "RXDAT offset");
        static_assert(offsetof(Registers, TXDAT) == 0x1C, "TXDAT offset");
        static_assert(offsetof(Registers, OSR) == 0x28, "OSR offset");

        // USART instance
        enum class UsartInstance : uint8_t {
            USART0 = 0,
            USART1 = 1,
            USART2 = 2
        };

        // Data length
        enum class DataLength : uint32_t {
            Bits7 = 0UL << 2,
            Bits8 = 1UL << 2,
            Bits9 = 2UL << 2
        };

        // Parity
        enum class Parity : uint32_t {
            None = 0UL << 4,
            Even = 2UL << 4,
            Odd = 3UL << 4
        };

        // Stop bits
        enum class StopBits : uint32_t {
            One = 0UL << 6,
            Two = 1UL << 6
        };

        // CFG register bits
        enum class CFG : uint32_t {
            ENABLE = (1UL << 0),          // USART enable
            DATALEN_MSK = (3UL << 2),     // Data length mask
            PARITYSEL_MSK = (3UL << 4),   // Parity mask
            STOPLEN = (1UL << 6),         // Two stop bits
            CTSEN = (1UL << 9),           // CTS enable
            SYNCEN = (1UL << 11),         // Synchronous mode
            LOOP = (1UL << 15)            // Loopback mode
        };

        // CTL register bits
        enum class CTL : uint32_t {
            TXBRKEN = (1UL << 1),         // Break enable
            ADDRDET = (1UL << 2),         // Address detect mode
            TXDIS = (1UL << 6),           // Transmit disable
            CC = (1UL << 8),              // Continuous clock generation
            CLRCCONRX = (1UL << 9),       // Clear continuous clock on received character
            AUTOBAUD = (1UL << 16)        // Autobaud enable
        };

        // STAT flags. Flags marked w1c are cleared by writing a one.
        enum class Flag : uint32_t {
            RXRDY = (1UL << 0),           // Receiver ready
            RXIDLE = (1UL << 1),          // Receiver idle
            TXRDY = (1UL << 2),           // Transmitter ready
            TXIDLE = (1UL << 3),          // Transmitter idle
            CTS = (1UL << 4),             // CTS signal asserted
            DELTACTS = (1UL << 5),        // Change of CTS signal detected (w1c)
            TXDIS = (1UL << 6),           // Transmitter disabled
            OVERRUN = (1UL << 8),         // Overrun error (w1c)
            RXBRK = (1UL << 10),          // Received break
            DELTARXBRK = (1UL << 11),     // RXBRK signal has changed state (w1c)
            START = (1UL << 12),          // Start detected (w1c)
            FRAMERR = (1UL << 13),        // Framing error (w1c)
            PARITYERR = (1UL << 14),      // Parity error (w1c)
            RXNOISE = (1UL << 15),        // Received noise (w1c)
            ABERR = (1UL << 16)           // Autobaud error (w1c)
        };

        constexpr uint32_t WRITE_ONE_TO_CLEAR_FLAGS =
            (1UL << 5) | (1UL << 8) | (1UL << 11) | (1UL << 12) |
            (1UL << 13) | (1UL << 14) | (1UL << 15) | (1UL << 16);

        constexpr uint32_t BRG_BRGVAL_MSK = 0xFFFFUL;
        constexpr uint32_t OSR_OSRVAL_MSK = 0xFUL;

        constexpr uint32_t getBitValue(CFG bit) {
            return static_cast<uint32_t>(bit);
        }

        constexpr uint32_t getBitValue(CTL bit) {
            return static_cast<uint32_t>(bit);
        }

        constexpr uint32_t getBitValue(Flag flag) {
            return static_cast<uint32_t>(flag);
        }

        constexpr bool isWriteOneToClear(Flag flag) {
            return (getBitValue(flag) & WRITE_ONE_TO_CLEAR_FLAGS) != 0;
        }

        // DMA request lines are hard-wired: USARTn RX uses channel 2n, TX uses 2n + 1
        constexpr uint8_t rxDmaChannel(UsartInstance instance) {
            return static_cast<uint8_t>(static_cast<uint8_t>(instance) * 2);
        }

        constexpr uint8_t txDmaChannel(UsartInstance instance) {
            return static_cast<uint8_t>(static_cast<uint8_t>(instance) * 2 + 1);
        }

        // Get USART registers
        inline Registers* getUsart(UsartInstance instance) {
            switch (instance) {
                case UsartInstance::USART0: return reinterpret_cast<Registers*>(USART0_BASE);
                case UsartInstance::USART1: return reinterpret_cast<Registers*>(USART1_BASE);
                case UsartInstance::USART2: return reinterpret_cast<Registers*>(USART2_BASE);
                default: return nullptr;
            }
        }
    }
}
