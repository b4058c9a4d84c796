#include "ControlTask.hpp"
#include "esp_log.h"

namespace DC_Speed_Regulator_Firmware::Control {

static constexpr const char* TAG = "ControlTask";

ControlTask::ControlTask(const ControlTaskConfig& cfg) : config(cfg) {
    exitSemaphore = xSemaphoreCreateBinary();
    if (exitSemaphore == nullptr) {
        ESP_LOGE(TAG, "Failed to create exit semaphore");
    }
}

ControlTask::~ControlTask() {
    if (taskHandle != nullptr) {
        stop();
    }
    if (periodTimer != nullptr) {
        esp_timer_delete(periodTimer);
        periodTimer = nullptr;
    }
    if (exitSemaphore != nullptr) {
        vSemaphoreDelete(exitSemaphore);
        exitSemaphore = nullptr;
    }
}

void ControlTask::setUpdateCallback(UpdateCallback cb) {
    updateCallback = cb;
}

esp_err_t ControlTask::start() {
    if (taskHandle != nullptr) {
        ESP_LOGW(TAG, "Task already running");
        return ESP_ERR_INVALID_STATE;
    }

    if (!updateCallback) {
        ESP_LOGE(TAG, "No update callback set");
        return ESP_ERR_INVALID_STATE;
    }

    if (config.periodUs == 0) {
        ESP_LOGE(TAG, "Invalid period 0 us");
        return ESP_ERR_INVALID_ARG;
    }

    UBaseType_t priorityToUse = config.priority;
    if (priorityToUse < 1) {
        priorityToUse = 1;
    }

    BaseType_t coreToUse = config.coreId;
    if (coreToUse != 0 && coreToUse != 1 && coreToUse != tskNO_AFFINITY) {
        coreToUse = tskNO_AFFINITY;
    }

    if (periodTimer == nullptr) {
        esp_timer_create_args_t timerArgs = {};
        timerArgs.callback = &ControlTask::timerCallback;
        timerArgs.arg = this;
        timerArgs.dispatch_method = ESP_TIMER_TASK;
        timerArgs.name = "ctrl_period";
        timerArgs.skip_unhandled_events = true;

        esp_err_t err = esp_timer_create(&timerArgs, &periodTimer);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "esp_timer_create failed: %s", esp_err_to_name(err));
            periodTimer = nullptr;
            return err;
        }
    }

    stopRequested.store(false, std::memory_order_relaxed);
    overrunCount.store(0, std::memory_order_relaxed);
    maxCallbackUs.store(0, std::memory_order_relaxed);
    inOverrun = false;

    ESP_LOGI(TAG, "Starting task (core=%ld, prio=%u, stack=%u, period=%lu us)",
             static_cast<long>(coreToUse), static_cast<unsigned>(priorityToUse),
             static_cast<unsigned>(config.stackSize), static_cast<unsigned long>(config.periodUs));

    BaseType_t res = xTaskCreatePinnedToCore(
        taskFunction,
        "ControlTask",
        config.stackSize,
        this,
        priorityToUse,
        &taskHandle,
        coreToUse
    );

    if (res != pdPASS) {
        ESP_LOGE(TAG, "xTaskCreatePinnedToCore failed");
        taskHandle = nullptr;
        return ESP_ERR_NO_MEM;
    }

    running.store(true, std::memory_order_relaxed);

    esp_err_t err = esp_timer_start_periodic(periodTimer, config.periodUs);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "esp_timer_start_periodic failed: %s", esp_err_to_name(err));
        stop();
        return err;
    }

    ESP_LOGI(TAG, "Task started");
    return ESP_OK;
}

esp_err_t ControlTask::stop(uint32_t timeoutMs) {
    if (taskHandle == nullptr) {
        ESP_LOGW(TAG, "No task to stop");
        return ESP_OK;
    }

    ESP_LOGI(TAG, "Requesting task stop");

    if (periodTimer != nullptr) {
        esp_err_t err = esp_timer_stop(periodTimer);
        if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
            ESP_LOGW(TAG, "esp_timer_stop failed: %s", esp_err_to_name(err));
        }
    }

    stopRequested.store(true, std::memory_order_relaxed);
    xTaskNotifyGive(taskHandle);

    esp_err_t result = ESP_OK;
    if (exitSemaphore != nullptr) {
        BaseType_t taken = xSemaphoreTake(exitSemaphore, pdMS_TO_TICKS(timeoutMs));
        if (taken != pdTRUE) {
            ESP_LOGW(TAG, "Task did not exit in time, forcing delete");
            vTaskDelete(taskHandle);
            result = ESP_ERR_TIMEOUT;
        }
    } else {
        vTaskDelay(pdMS_TO_TICKS(100));
        vTaskDelete(taskHandle);
    }

    taskHandle = nullptr;
    stopRequested.store(false, std::memory_order_relaxed);
    running.store(false, std::memory_order_relaxed);
    ESP_LOGI(TAG, "Task stopped (overruns=%lu, max callback=%lu us)",
             static_cast<unsigned long>(overrunCount.load(std::memory_order_relaxed)),
             static_cast<unsigned long>(maxCallbackUs.load(std::memory_order_relaxed)));
    return result;
}

bool ControlTask::isRunning() const noexcept {
    return running.load(std::memory_order_relaxed);
}

uint32_t ControlTask::getOverrunCount() const noexcept {
    return overrunCount.load(std::memory_order_relaxed);
}

uint32_t ControlTask::getMaxCallbackUs() const noexcept {
    return maxCallbackUs.load(std::memory_order_relaxed);
}

ControlTaskConfig ControlTask::getConfig() const noexcept {
    return config;
}

TaskHandle_t ControlTask::getTaskHandle() const noexcept {
    return taskHandle;
}

void ControlTask::taskFunction(void* param) {
    auto* self = static_cast<ControlTask*>(param);
    self->runLoop();
}

void ControlTask::timerCallback(void* param) {
    auto* self = static_cast<ControlTask*>(param);
    TaskHandle_t handle = self->taskHandle;
    if (handle != nullptr) {
        xTaskNotifyGive(handle);
    }
}

void ControlTask::recordOverrun(uint32_t missed, int64_t callbackUs) {
    overrunCount.fetch_add(missed > 0 ? missed : 1, std::memory_order_relaxed);
    if (!inOverrun) {
        ESP_LOGW(TAG, "Overrun: missed=%lu, callback=%lld us (period %lu us)",
                 static_cast<unsigned long>(missed), static_cast<long long>(callbackUs),
                 static_cast<unsigned long>(config.periodUs));
    }
    inOverrun = true;
}

void ControlTask::runLoop() {
    ESP_LOGI(TAG, "Task loop start (period=%lu us)", static_cast<unsigned long>(config.periodUs));

    int64_t lastCallbackUs = 0;
    const TickType_t blockTicks = pdMS_TO_TICKS(100) > 0 ? pdMS_TO_TICKS(100) : 1;

    while (!stopRequested.load(std::memory_order_relaxed)) {
        uint32_t taken = ulTaskNotifyTake(pdTRUE, blockTicks);
        if (taken == 0) {
            continue;
        }
        if (stopRequested.load(std::memory_order_relaxed)) {
            break;
        }

        const uint32_t missed = taken - 1;
        if (missed > 0 || lastCallbackUs > static_cast<int64_t>(config.periodUs)) {
            recordOverrun(missed, lastCallbackUs);
        } else if (inOverrun) {
            ESP_LOGI(TAG, "Overrun cleared (total=%lu)",
                     static_cast<unsigned long>(overrunCount.load(std::memory_order_relaxed)));
            inOverrun = false;
        }

        const int64_t startUs = esp_timer_get_time();
        updateCallback();
        lastCallbackUs = esp_timer_get_time() - startUs;

        if (lastCallbackUs > static_cast<int64_t>(maxCallbackUs.load(std::memory_order_relaxed))) {
            maxCallbackUs.store(static_cast<uint32_t>(lastCallbackUs), std::memory_order_relaxed);
        }
    }

    ESP_LOGI(TAG, "Task loop exiting");
    running.store(false, std::memory_order_relaxed);
    if (exitSemaphore != nullptr) {
        xSemaphoreGive(exitSemaphore);
    }
    vTaskDelete(nullptr);
}

}  // namespace DC_Speed_Regulator_Firmware::Control
