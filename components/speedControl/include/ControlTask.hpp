/**
 * @file ControlTask.hpp
 * @brief FreeRTOS task wrapper for the fixed-rate control period.
 *
 * An esp_timer periodic callback notifies the task once per control period; the task
 * runs the update callback once per notification. Missed notifications and callbacks
 * longer than one period are counted as overruns.
 */

#pragma once

#include "esp_err.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"
#include <atomic>
#include <cstdint>
#include <functional>

namespace DC_Speed_Regulator_Firmware::Control {

/**
 * @struct ControlTaskConfig
 * @brief Configuration for control task scheduling.
 */
struct ControlTaskConfig {
    uint32_t periodUs = 1000;                        ///< Control period (us)
    BaseType_t coreId = 1;                           ///< Core affinity (tskNO_AFFINITY = any)
    UBaseType_t priority = configMAX_PRIORITIES - 2; ///< Task priority
    uint32_t stackSize = 4096;                       ///< Stack size (bytes)
};

/**
 * @brief Callback type for the update function.
 */
using UpdateCallback = std::function<void()>;

/**
 * @class ControlTask
 * @brief Owns the FreeRTOS task and the period timer.
 */
class ControlTask {
  public:
    /**
     * @brief Construct control task.
     * @param cfg Task configuration
     */
    explicit ControlTask(const ControlTaskConfig& cfg = ControlTaskConfig());

    /**
     * @brief Destructor. Stops task if running.
     */
    ~ControlTask();

    ControlTask(const ControlTask&) = delete;
    ControlTask& operator=(const ControlTask&) = delete;
    ControlTask(ControlTask&&) = delete;
    ControlTask& operator=(ControlTask&&) = delete;

    /**
     * @brief Set the update callback function.
     * @param cb Function to call once per control period
     */
    void setUpdateCallback(UpdateCallback cb);

    /**
     * @brief Create the task and start the period timer.
     * @return ESP_OK, ESP_ERR_INVALID_STATE if running or no callback,
     *         ESP_ERR_NO_MEM if the task could not be created, or the esp_timer error
     */
    esp_err_t start();

    /**
     * @brief Stop the timer and the task.
     * @param timeoutMs Timeout to wait for graceful exit
     * @return ESP_OK, or ESP_ERR_TIMEOUT if the task had to be deleted
     */
    esp_err_t stop(uint32_t timeoutMs = 2000);

    /**
     * @brief Check if task is running.
     * @return True if running
     */
    bool isRunning() const noexcept;

    /**
     * @brief Total overruns since start.
     * @return Missed periods plus callbacks longer than one period
     */
    uint32_t getOverrunCount() const noexcept;

    /**
     * @brief Longest callback duration seen since start.
     * @return Duration in microseconds
     */
    uint32_t getMaxCallbackUs() const noexcept;

    /**
     * @brief Get current configuration.
     * @return Current configuration
     */
    ControlTaskConfig getConfig() const noexcept;

    /**
     * @brief Get task handle (for diagnostics).
     * @return Task handle or nullptr
     */
    TaskHandle_t getTaskHandle() const noexcept;

  private:
    /**
     * @brief Static task entry point.
     * @param param ControlTask instance
     */
    static void taskFunction(void* param);

    /**
     * @brief esp_timer callback, notifies the task.
     * @param param ControlTask instance
     */
    static void timerCallback(void* param);

    /**
     * @brief Task main loop.
     */
    void runLoop();

    /**
     * @brief Count an overrun and log its onset.
     * @param missed Periods lost
     * @param callbackUs Duration of the last callback
     */
    void recordOverrun(uint32_t missed, int64_t callbackUs);

    ControlTaskConfig config;                    ///< Configuration
    UpdateCallback updateCallback;               ///< User callback
    TaskHandle_t taskHandle = nullptr;           ///< FreeRTOS task handle
    esp_timer_handle_t periodTimer = nullptr;    ///< Period source
    SemaphoreHandle_t exitSemaphore = nullptr;   ///< Exit signaling
    std::atomic<bool> stopRequested{false};      ///< Stop flag
    std::atomic<bool> running{false};            ///< Running state
    std::atomic<uint32_t> overrunCount{0};       ///< Overruns since start
    std::atomic<uint32_t> maxCallbackUs{0};      ///< Worst callback duration
    bool inOverrun = false;                      ///< Last period overran (log dedupe)
};

}  // namespace DC_Speed_Regulator_Firmware::Control
