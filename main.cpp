#include "os/FreeRTOSConfig.h"
#include "hardware_abstraction/syscon.hpp"
#include "hardware_abstraction/usart.hpp"
#include "hardware_abstraction/dma.hpp"
#include "middleware/system_services/error.hpp"
#include "middleware/system_services/system_timing.hpp"
#include "FreeRTOS.h"
#include "task.h"
#include "tasks/uart_dma_tasks.hpp"
#include "logging/rtt_error_handler.hpp"
#include "SEGGER_RTT.h"
#include <utility>

using Platform::InitState::Enabled;

// The controller keeps the table address for as long as it runs
static Platform::DMA::DescriptorTable dma_descriptors;

static APP::RttErrorHandler rtt_error_handler;
static APP::UartDmaTaskContext uart_dma_context;

static uint32_t ReadTickCount() {
    return static_cast<uint32_t>(xTaskGetTickCount());
}

// System initialization function
Platform::Status SystemInit() {
    using namespace Middleware::SystemServices;

    SEGGER_RTT_Init();
    ERROR::ErrorManager::RegisterErrorHandler(&rtt_error_handler);
    ERROR::ErrorManager::SetVerbosityLevel(ERROR::ErrorVerbosityLevel::Normal);

    // Initialize timing service
    Platform::Status status = SystemTiming::GetInstance().SetTickSource(ReadTickCount, configTICK_RATE_HZ);
    if (status != Platform::Status::OK) {
        return status;
    }

    auto& syscon = Platform::SYSCON::SysconInterface::GetInstance();
    status = syscon.Init(nullptr);
    if (status != Platform::Status::OK) {
        return status;
    }

    // USART function clock and the TXD pin assignment are left to the board startup code.
    // 12 MHz / (13 * 8) = 115384 baud
    Platform::USART::UsartConfig usart_config = {
        .instance = Platform::USART::UsartInstance::USART0,
        .brg_value = 7,
        .osr_value = 12,
        .data_length = Platform::USART::DataLength::Bits8,
        .parity = Platform::USART::Parity::None,
        .stop_bits = Platform::USART::StopBits::One
    };

    auto& usart = Platform::USART::UsartInterface::GetInstance(Platform::USART::UsartInstance::USART0);
    status = usart.Init(&usart_config);
    if (status != Platform::Status::OK) {
        return status;
    }

    return Platform::Status::OK;
}

int main() {

    // Initialize the system
    Platform::Status status = SystemInit();
    if (status != Platform::Status::OK) {
        // Error handling - already reported over RTT
        while (1) {
            // If system init fails, we can't proceed
        }
    }

    auto& syscon = Platform::SYSCON::SysconInterface::GetInstance();
    auto& usart = Platform::USART::UsartInterface::GetInstance(Platform::USART::UsartInstance::USART0);

    // Static storage: the main stack is reused for interrupts once the scheduler runs
    static Platform::DMA::Parts dma = Platform::DMA::Dma::Split(dma_descriptors);
    static Platform::DMA::Handle<Enabled> dma_handle = std::move(dma.handle).Enable(syscon);

    uint8_t tx_channel = Platform::USART::txDmaChannel(Platform::USART::UsartInstance::USART0);
    uart_dma_context.usart = &usart;
    uart_dma_context.channel.emplace(dma.channels.Take(tx_channel).Enable(dma_handle));

    // Create and start tasks
    status = APP::CreateUartDmaTask(uart_dma_context);
    if (status != Platform::Status::OK) {
        while (1) {
            // If task creation fails, we can't proceed
        }
    }

    // Start the scheduler
    vTaskStartScheduler();

    // Should never reach here
    while(1) {}

    return 0;
}
