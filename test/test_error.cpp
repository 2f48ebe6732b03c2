#include <gtest/gtest.h>
#include "system_services/error.hpp"
#include "test_support.hpp"
#include <cstring>

using namespace Middleware::SystemServices::ERROR;

class ErrorManagerTest : public ::testing::Test {
protected:
    TestSupport::ErrorCapture capture;

    void TearDown() override {
        ErrorManager::SetVerbosityLevel(ErrorVerbosityLevel::Normal);
    }
};

using ErrorManagerDeathTest = ErrorManagerTest;

TEST_F(ErrorManagerTest, HistoryIsNewestFirst) {
    ERROR_LOG_WITH_INFO(MODULE_DMA, DMA_INVALID_ENDPOINT, Platform::Status::INVALID_PARAM, 1);
    ERROR_LOG_WITH_INFO(MODULE_UART, UART_TIMEOUT, Platform::Status::TIMEOUT, 2);

    ErrorInfo history[4] = {};
    ASSERT_EQ(ErrorManager::GetErrorHistory(history, 4), 2u);
    EXPECT_EQ(history[0].error_id, UART_TIMEOUT);
    EXPECT_EQ(history[0].module_id, MODULE_UART);
    EXPECT_EQ(history[0].additional_info, 2u);
    EXPECT_EQ(history[1].error_id, DMA_INVALID_ENDPOINT);
}

TEST_F(ErrorManagerTest, HistoryKeepsTheMostRecentEntries) {
    for (uint32_t i = 0; i < ERROR_HISTORY_SIZE + 8; i++) {
        ERROR_LOG_WITH_INFO(MODULE_DMA, DMA_INVALID_ENDPOINT, Platform::Status::INVALID_PARAM, i);
    }

    ErrorInfo history[ERROR_HISTORY_SIZE + 8] = {};
    ASSERT_EQ(ErrorManager::GetErrorHistory(history, ERROR_HISTORY_SIZE + 8), ERROR_HISTORY_SIZE);
    EXPECT_EQ(history[0].additional_info, ERROR_HISTORY_SIZE + 7);
    EXPECT_EQ(history[ERROR_HISTORY_SIZE - 1].additional_info, 8u);
}

TEST_F(ErrorManagerTest, HistoryRespectsCallerLimit) {
    ERROR_LOG(MODULE_DMA, DMA_INVALID_ENDPOINT, Platform::Status::INVALID_PARAM);
    ERROR_LOG(MODULE_DMA, DMA_INVALID_ENDPOINT, Platform::Status::INVALID_PARAM);

    ErrorInfo history[1] = {};
    EXPECT_EQ(ErrorManager::GetErrorHistory(history, 1), 1u);
    EXPECT_EQ(ErrorManager::GetErrorHistory(nullptr, 1), 0u);

    ErrorManager::ClearErrorHistory();
    EXPECT_EQ(ErrorManager::GetErrorHistory(history, 1), 0u);
}

TEST_F(ErrorManagerTest, LogRecordsFileAndLine) {
    uint32_t line = __LINE__ + 1;
    ERROR_LOG(MODULE_SYSCON, SYSCON_INVALID_PERIPHERAL, Platform::Status::INVALID_PARAM);

    ASSERT_EQ(capture.recorder.errors.size(), 1u);
    const ErrorInfo& error = capture.recorder.errors[0];
    EXPECT_EQ(error.line, line);
    EXPECT_NE(std::strstr(error.location, "test_error.cpp"), nullptr);
    EXPECT_EQ(error.status_code, Platform::Status::INVALID_PARAM);
}

TEST_F(ErrorManagerTest, NormalVerbosityDropsSuccess) {
    ERROR_LOG(MODULE_DMA, DMA_INVALID_ENDPOINT, Platform::Status::OK);
    EXPECT_TRUE(capture.recorder.errors.empty());

    ErrorManager::SetVerbosityLevel(ErrorVerbosityLevel::Debug);
    ERROR_LOG(MODULE_DMA, DMA_INVALID_ENDPOINT, Platform::Status::OK);
    EXPECT_EQ(capture.recorder.errors.size(), 1u);
}

TEST_F(ErrorManagerTest, CriticalVerbosityKeepsHardwareFaults) {
    ErrorManager::SetVerbosityLevel(ErrorVerbosityLevel::Critical);
    EXPECT_EQ(ErrorManager::GetVerbosityLevel(), ErrorVerbosityLevel::Critical);

    ERROR_LOG(MODULE_UART, UART_TIMEOUT, Platform::Status::TIMEOUT);
    ERROR_LOG(MODULE_UART, UART_RECEIVE_ERROR, Platform::Status::COMMUNICATION_ERROR);
    ERROR_LOG(MODULE_DMA, DMA_CLOCK_ENABLE_FAILED, Platform::Status::HARDWARE_ERROR);

    ASSERT_EQ(capture.recorder.errors.size(), 2u);
    EXPECT_EQ(capture.recorder.errors[0].error_id, UART_RECEIVE_ERROR);
    EXPECT_EQ(capture.recorder.errors[1].error_id, DMA_CLOCK_ENABLE_FAILED);
}

TEST_F(ErrorManagerTest, NoneVerbositySilencesLogging) {
    ErrorManager::SetVerbosityLevel(ErrorVerbosityLevel::None);
    ERROR_LOG(MODULE_UART, UART_RECEIVE_ERROR, Platform::Status::COMMUNICATION_ERROR);

    ErrorInfo history[1] = {};
    EXPECT_EQ(ErrorManager::GetErrorHistory(history, 1), 0u);
    EXPECT_TRUE(capture.recorder.errors.empty());
}

TEST_F(ErrorManagerTest, UnregisteredHandlerIsNotCalled) {
    TestSupport::RecordingErrorHandler extra;
    ErrorManager::RegisterErrorHandler(&extra);
    ERROR_LOG(MODULE_DMA, DMA_INVALID_ENDPOINT, Platform::Status::INVALID_PARAM);

    ErrorManager::UnregisterErrorHandler(&extra);
    ERROR_LOG(MODULE_DMA, DMA_INVALID_ENDPOINT, Platform::Status::INVALID_PARAM);

    EXPECT_EQ(extra.errors.size(), 1u);
    EXPECT_EQ(capture.recorder.errors.size(), 2u);
}

TEST_F(ErrorManagerTest, HandlerTableIsBounded) {
    // The capture already holds two slots
    TestSupport::RecordingErrorHandler extra[MAX_ERROR_HANDLERS - 1];
    for (auto& handler : extra) {
        ErrorManager::RegisterErrorHandler(&handler);
    }

    ERROR_LOG(MODULE_DMA, DMA_INVALID_ENDPOINT, Platform::Status::INVALID_PARAM);

    for (size_t i = 0; i < MAX_ERROR_HANDLERS - 2; i++) {
        EXPECT_EQ(extra[i].errors.size(), 1u) << "handler " << i;
    }
    EXPECT_TRUE(extra[MAX_ERROR_HANDLERS - 2].errors.empty());

    for (auto& handler : extra) {
        ErrorManager::UnregisterErrorHandler(&handler);
    }
}

TEST_F(ErrorManagerTest, ReturnIfErrorLogsAndPropagates) {
    auto failing = []() -> Platform::Status {
        RETURN_IF_ERROR(MODULE_UART, Platform::Status::TIMEOUT);
        return Platform::Status::OK;
    };
    auto passing = []() -> Platform::Status {
        RETURN_IF_ERROR(MODULE_UART, Platform::Status::OK);
        return Platform::Status::BUSY;
    };

    EXPECT_EQ(failing(), Platform::Status::TIMEOUT);
    EXPECT_EQ(passing(), Platform::Status::BUSY);
    ASSERT_EQ(capture.recorder.errors.size(), 1u);
    EXPECT_EQ(capture.recorder.errors[0].error_id, UART_TIMEOUT);
}

TEST_F(ErrorManagerDeathTest, FatalAbortsAfterNotifyingHandlers) {
    EXPECT_DEATH({
        ERROR_FATAL(MODULE_DMA, DMA_TABLE_IN_USE, Platform::Status::INVALID_STATE, 0);
    }, "descriptor table already claimed");
}

TEST_F(ErrorManagerDeathTest, FatalIgnoresVerbosity) {
    ErrorManager::SetVerbosityLevel(ErrorVerbosityLevel::None);

    EXPECT_DEATH({
        ERROR_FATAL(MODULE_UART, UART_NOT_INITIALIZED, Platform::Status::NOT_INITIALIZED, 0);
    }, "USART: not initialized");
}

TEST(ErrorCodeTest, StatusConversionFollowsErrorId) {
    EXPECT_EQ(ToStatus(UART_TIMEOUT), Platform::Status::TIMEOUT);
    EXPECT_EQ(ToStatus(DMA_TRANSFER_TOO_LARGE), Platform::Status::BUFFER_OVERFLOW);
    EXPECT_EQ(ToStatus(DMA_UNSUPPORTED_TRANSFER), Platform::Status::NOT_SUPPORTED);
    EXPECT_EQ(ToStatus(DMA_CHANNEL_MISMATCH), Platform::Status::INVALID_PARAM);
    EXPECT_EQ(ToStatus(DMA_HANDLE_RELEASED), Platform::Status::INVALID_STATE);
    EXPECT_EQ(ToStatus(MODULE_DMA | 0x00FF), Platform::Status::ERROR);

    EXPECT_EQ(FromStatus(Platform::Status::OK), 0u);
    EXPECT_EQ(FromStatus(Platform::Status::TIMEOUT), ERR_TIMEOUT);
    EXPECT_EQ(FromStatus(Platform::Status::BUFFER_OVERFLOW), ERR_OVERFLOW);
    EXPECT_EQ(MODULE_UART | FromStatus(Platform::Status::INVALID_PARAM), UART_INVALID_CONFIG);
}

TEST(ErrorCodeTest, CodesCarryTheirModule) {
    EXPECT_EQ(DMA_TRANSFER_ABANDONED & 0xFF00, MODULE_DMA);
    EXPECT_EQ(UART_RECEIVE_ERROR & 0xFF00, MODULE_UART);
    EXPECT_EQ(SYSCON_INVALID_PERIPHERAL & 0xFF00, MODULE_SYSCON);
}

TEST(ErrorCodeTest, DescriptionsNameTheFault) {
    EXPECT_STREQ(GetErrorDescription(DMA_TRANSFER_TOO_LARGE), "DMA: transfer exceeds 1024 units");
    EXPECT_STREQ(GetErrorDescription(DMA_TRANSFER_ABANDONED),
                 "DMA: transfer dropped while active, channel aborted");
    EXPECT_STREQ(GetErrorDescription(UART_RECEIVE_ERROR),
                 "USART: overrun, framing, parity or noise error");
    // Unknown module falls back to the generic error id text
    EXPECT_STREQ(GetErrorDescription(MODULE_APPLICATION_MAIN | ERR_TIMEOUT), "Timeout");
    EXPECT_STREQ(GetErrorDescription(0x00FF), "Unknown error");
}
