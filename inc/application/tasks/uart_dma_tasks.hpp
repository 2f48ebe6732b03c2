// uart_dma_tasks.hpp
#pragma once

#include "FreeRTOS.h"
#include "task.h"
#include "hardware_abstraction/dma.hpp"
#include "hardware_abstraction/usart.hpp"
#include <optional>

namespace APP {

// Task priorities (higher number = higher priority)
constexpr UBaseType_t TASK_PRIORITY_UART_DMA = 2;

// Task periods
constexpr uint32_t UART_DMA_TASK_PERIOD_MS = 500;   // One message every half second
constexpr uint32_t UART_DMA_POLL_PERIOD_MS = 2;     // Completion polling interval

// Stack sizes
constexpr uint32_t UART_DMA_TASK_STACK_SIZE = (configMINIMAL_STACK_SIZE * 2);

// Task configuration structure
struct TaskConfig {
    uint16_t stack_size;
    UBaseType_t priority;
    const char* name;
};

// State shared with the task; must outlive the scheduler
struct UartDmaTaskContext {
    Platform::USART::UsartInterface* usart;
    std::optional<Platform::DMA::Channel<Platform::InitState::Enabled>> channel;
    uint32_t messages_sent;
    TaskHandle_t task_handle;
};

Platform::Status CreateUartDmaTask(UartDmaTaskContext& context);

// Task function declarations
void vUartDmaTask(void* params);

} // namespace APP
