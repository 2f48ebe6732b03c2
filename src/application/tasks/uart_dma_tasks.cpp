// uart_dma_tasks.cpp
#include "tasks/uart_dma_tasks.hpp"
#include "system_services/error.hpp"
#include "SEGGER_RTT.h"
#include <utility>

using namespace Middleware::SystemServices::ERROR;

namespace APP {

static const char UART_DMA_MESSAGE[] = "LPC8xx DMA: hello over USART0\r\n";

Platform::Status CreateUartDmaTask(UartDmaTaskContext& context) {
    if (context.usart == nullptr || !context.channel.has_value()) {
        return Platform::Status::INVALID_PARAM;
    }

    TaskConfig task_config = {
        .stack_size = UART_DMA_TASK_STACK_SIZE,
        .priority = TASK_PRIORITY_UART_DMA,
        .name = "UartDma"
    };

    BaseType_t result = xTaskCreate(
        vUartDmaTask,
        task_config.name,
        task_config.stack_size,
        &context,  // Pass the shared context as parameter
        task_config.priority,
        &context.task_handle
    );

    if (result != pdPASS) {
        ERROR_LOG(MODULE_APPLICATION_MAIN, MODULE_APPLICATION_MAIN | ERR_INITIALIZATION,
                  Platform::Status::RESOURCE_ERROR);
        return Platform::Status::RESOURCE_ERROR;
    }
    return Platform::Status::OK;
}

void vUartDmaTask(void* params) {

    UartDmaTaskContext* context = static_cast<UartDmaTaskContext*>(params);

    Platform::DMA::MemorySource message(
        reinterpret_cast<const uint8_t*>(UART_DMA_MESSAGE), sizeof(UART_DMA_MESSAGE) - 1);

    TickType_t xLastWakeTime = xTaskGetTickCount();

    SEGGER_RTT_printf(0, "UART DMA task started on channel %u\n",
                      static_cast<unsigned>(context->channel->Index()));

    while (true) {
        auto transfer = context->usart->StartDmaWrite(std::move(*context->channel), message);
        context->channel.reset();

        // The controller runs on its own; give the CPU away while it does
        while (transfer.Poll() == Platform::Status::BUSY) {
            vTaskDelay(pdMS_TO_TICKS(UART_DMA_POLL_PERIOD_MS));
        }

        auto payload = std::move(transfer).Wait();
        context->channel.emplace(std::move(payload.channel));

        if (payload.status != Platform::Status::OK) {
            ERROR_LOG(MODULE_APPLICATION_MAIN, FromStatus(payload.status), payload.status);
        } else {
            context->messages_sent++;
            SEGGER_RTT_printf(0, "Sent %u messages\n", static_cast<unsigned>(context->messages_sent));
        }

        vTaskDelayUntil(&xLastWakeTime, pdMS_TO_TICKS(UART_DMA_TASK_PERIOD_MS));
    }
}

} // namespace APP
