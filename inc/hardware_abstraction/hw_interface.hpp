#pragma once

#include "common/platform.hpp"

namespace Platform {
/**
 * Hardware interface abstract base class for the configure-and-use
 * peripherals (SYSCON, USART). The DMA controller does not derive from it;
 * its channels are handed out as typed values instead.
 */
class HwInterface {
public:
    // Virtual destructor ensures proper cleanup for derived classes
    virtual ~HwInterface() = default;

    /**
     * Initialize the hardware peripheral with specific configuration
     *
     * @param config Pointer to peripheral-specific configuration, may be nullptr
     *               for peripherals without one
     * @return Status code indicating success or failure
     */
    virtual Platform::Status Init(void* config) = 0;

    /**
     * Return the peripheral to its reset state and gate its clock
     *
     * @return Status code indicating success or failure
     */
    virtual Platform::Status DeInit() = 0;

    /**
     * Control the hardware peripheral with specific commands
     *
     * @param command Control command identifier (XXX_CTRL_* constants)
     * @param param Command-specific parameter
     * @return Status code indicating success or failure
     */
    virtual Platform::Status Control(uint32_t command, void* param) = 0;

    /**
     * Read data from the hardware peripheral
     *
     * @param buffer Buffer to store the read data
     * @param size Size of data to read (in bytes)
     * @param timeout Timeout for the operation (in milliseconds)
     * @return Status code indicating success or failure
     */
    virtual Platform::Status Read(void* buffer, uint16_t size, uint32_t timeout) = 0;

    /**
     * Write data to the hardware peripheral
     *
     * @param data Data to write
     * @param size Size of data to write (in bytes)
     * @param timeout Timeout for the operation (in milliseconds)
     * @return Status code indicating success or failure
     */
    virtual Platform::Status Write(const void* data, uint16_t size, uint32_t timeout) = 0;

    /**
     * Register a callback function for hardware events
     *
     * @param eventId Event identifier
     * @param callback Callback function pointer
     * @param param Parameter to pass to the callback function
     * @return Status code indicating success or failure
     */
    virtual Platform::Status RegisterCallback(uint32_t eventId,
                                     void (*callback)(void* param),
                                     void* param) = 0;
};

}
