#include "NecIRDecoder.h"
#include <driver/gpio.h>
#include <driver/rmt_rx.h>
#include <driver/rmt_types.h>
#include <esp_log.h>
#include <freertos/semphr.h>
#include <freertos/task.h>
#include <algorithm>

namespace necir
{

    namespace
    {
        constexpr const char *kTag = "NecIRDecoder";
        constexpr UBaseType_t kPulseQueueLength = 256;
        constexpr uint32_t kRmtMaxSymbolTicks = 32767; // 15-bit duration field
        constexpr uint32_t kGlitchFilterNs = 1250;
        constexpr uint32_t kMaxPollHz = 20000;

        // FromISR view of the pulse queue for forwardBurst().
        struct IsrPulseQueue
        {
            QueueHandle_t queue;
            UBaseType_t length;
            BaseType_t *highTaskWoken;

            size_t spaces() const { return length - uxQueueMessagesWaitingFromISR(queue); }
            bool push(uint32_t value) { return xQueueSendFromISR(queue, &value, highTaskWoken) == pdTRUE; }
        };

        void fenceCallback(void *arg)
        {
            xSemaphoreGive(static_cast<SemaphoreHandle_t>(arg));
        }

        bool rxDoneCallback(rmt_channel_handle_t, const rmt_rx_done_event_data_t *edata, void *user_ctx)
        {
            auto ctx = static_cast<necir::Receiver::RxCallbackContext *>(user_ctx);
            if (!ctx || !ctx->queue || !ctx->overflowFlag || !edata)
            {
                return false;
            }
            BaseType_t high_task_woken = pdFALSE;
            IsrPulseQueue queue{ctx->queue, ctx->queueLength, &high_task_woken};
            // duration1 == 0: trailing mark, the line went idle before the next edge.
            size_t pairCount = 0;
            while (pairCount < edata->num_symbols && edata->received_symbols[pairCount].duration1 != 0)
            {
                ++pairCount;
            }
            auto pairAt = [edata](size_t i, uint32_t &low, uint32_t &high)
            {
                low = edata->received_symbols[i].duration0;
                high = edata->received_symbols[i].duration1;
            };
            // A burst that does not fit is dropped whole; only its end marker is queued.
            bool queued = necir::forwardBurst(queue, pairCount, pairAt);
            if (!queued)
            {
                *(ctx->overflowFlag) = true;
            }

            // Symbols are copied out; re-arm on the same buffer.
            if (ctx->channel && ctx->rxConfig)
            {
                esp_err_t err = rmt_receive(ctx->channel, ctx->buffer, ctx->bufferLenSymbols * sizeof(rmt_symbol_word_t), ctx->rxConfig);
                if (ctx->needRestart)
                    *(ctx->needRestart) = (err != ESP_OK);
            }
            return high_task_woken == pdTRUE;
        }
    } // namespace

    bool QueuePulseSource::read(uint32_t &ticks)
    {
        if (!queue_)
        {
            return false;
        }
        return xQueueReceive(queue_, &ticks, 0) == pdTRUE;
    }

    Receiver::Receiver() = default;
    Receiver::Receiver(int pin, bool commandRepeat)
        : rxPin_(pin), commandRepeat_(commandRepeat) {}

    Receiver::~Receiver()
    {
        end();
    }

    bool Receiver::setPin(int pin)
    {
        if (begun_)
            return false;
        rxPin_ = pin;
        return true;
    }
    bool Receiver::setCommandRepeat(bool commandRepeat)
    {
        if (begun_)
            return false;
        commandRepeat_ = commandRepeat;
        return true;
    }
    bool Receiver::setStrictHeader(bool strictHeader)
    {
        if (begun_)
            return false;
        strictHeader_ = strictHeader;
        return true;
    }
    bool Receiver::setResolutionHz(uint32_t resolutionHz)
    {
        if (begun_ || resolutionHz == 0)
            return false;
        resolutionHz_ = resolutionHz;
        return true;
    }
    bool Receiver::setIdleTimeoutUs(uint32_t idleTimeoutUs)
    {
        if (begun_ || idleTimeoutUs == 0)
            return false;
        idleTimeoutUs_ = idleTimeoutUs;
        return true;
    }
    bool Receiver::setPollHz(uint32_t pollHz)
    {
        if (begun_ || pollHz == 0 || pollHz > kMaxPollHz)
            return false;
        pollHz_ = pollHz;
        return true;
    }

    void Receiver::pollTimerCallback(void *arg)
    {
        auto self = static_cast<necir::Receiver *>(arg);
        if (self)
        {
            self->acquisition_.service();
        }
    }

    // esp_timer_stop() does not wait for a callback already running in the
    // esp_timer task. Callbacks run there one at a time, so once a one-shot
    // fence scheduled after the stop has fired, no drain is in flight.
    // Must not be called from an esp_timer callback.
    void Receiver::waitForTimerTask()
    {
        StaticSemaphore_t fenceStorage;
        SemaphoreHandle_t fence = xSemaphoreCreateBinaryStatic(&fenceStorage);
        esp_timer_create_args_t fenceArgs = {};
        fenceArgs.callback = &fenceCallback;
        fenceArgs.arg = fence;
        fenceArgs.dispatch_method = ESP_TIMER_TASK;
        fenceArgs.name = "necir_fence";
        esp_timer_handle_t fenceTimer = nullptr;
        if (esp_timer_create(&fenceArgs, &fenceTimer) != ESP_OK)
        {
            ESP_LOGW(kTag, "RX end: fence timer create failed; waiting two poll periods");
            vTaskDelay(pdMS_TO_TICKS(2 + 2000 / pollHz_));
            return;
        }
        if (esp_timer_start_once(fenceTimer, 1) == ESP_OK)
        {
            xSemaphoreTake(fence, portMAX_DELAY);
        }
        else
        {
            ESP_LOGW(kTag, "RX end: fence timer start failed; waiting two poll periods");
            vTaskDelay(pdMS_TO_TICKS(2 + 2000 / pollHz_));
        }
        esp_timer_delete(fenceTimer);
    }

    void Receiver::releaseResources()
    {
        if (pollTimer_)
        {
            esp_timer_stop(pollTimer_);
            waitForTimerTask();
            esp_timer_delete(pollTimer_);
            pollTimer_ = nullptr;
        }
        if (rxChannel_)
        {
            rmt_disable(rxChannel_);
            rmt_del_channel(rxChannel_);
            rxChannel_ = nullptr;
        }
        // Drain side is quiet from here on.
        source_.detach();
        if (pulseQueue_)
        {
            vQueueDelete(pulseQueue_);
            pulseQueue_ = nullptr;
        }
    }

    bool Receiver::begin()
    {
        if (begun_)
        {
            ESP_LOGW(kTag, "RX begin called while already begun");
            return false;
        }
        if (rxPin_ < 0)
        {
            ESP_LOGE(kTag, "RX begin failed: pin not set");
            return false;
        }
        rxOverflowed_ = false;
        rxNeedRestart_ = false;
        rmt_rx_channel_config_t config = {};
        config.gpio_num = static_cast<gpio_num_t>(rxPin_);
        config.clk_src = RMT_CLK_SRC_DEFAULT;
        config.resolution_hz = resolutionHz_;
        config.mem_block_symbols = kRxBufferSymbols;
        if (rmt_new_rx_channel(&config, &rxChannel_) != ESP_OK)
        {
            ESP_LOGE(kTag, "RX begin failed: rmt_new_rx_channel");
            rxChannel_ = nullptr;
            return false;
        }
        // IR receiver modules idle high and pull low while a carrier is present.
        gpio_pullup_en(static_cast<gpio_num_t>(rxPin_));

        pulseQueue_ = xQueueCreate(kPulseQueueLength, sizeof(uint32_t));
        if (!pulseQueue_)
        {
            ESP_LOGE(kTag, "RX begin failed: queue create");
            releaseResources();
            return false;
        }
        // RMT ticks are 1/resolution; the acquisition formula counts two clock cycles per tick.
        source_.attach(pulseQueue_, resolutionHz_ * 2);
        acquisition_.reset();
        decoder_.setCommandRepeat(commandRepeat_);
        decoder_.setStrictHeader(strictHeader_);
        lastOverflowCount_ = acquisition_.overflowCount();

        rxCallbackCtx_ = {};
        rxCallbackCtx_.queue = pulseQueue_;
        rxCallbackCtx_.queueLength = kPulseQueueLength;
        rxCallbackCtx_.channel = rxChannel_;
        rxCallbackCtx_.buffer = rxBuffer_;
        rxCallbackCtx_.bufferLenSymbols = kRxBufferSymbols;
        rxCallbackCtx_.rxConfig = &rxConfig_;
        rxCallbackCtx_.overflowFlag = &rxOverflowed_;
        rxCallbackCtx_.needRestart = &rxNeedRestart_;
        rmt_rx_event_callbacks_t cbs = {
            .on_recv_done = rxDoneCallback,
        };
        if (rmt_rx_register_event_callbacks(rxChannel_, &cbs, &rxCallbackCtx_) != ESP_OK)
        {
            ESP_LOGE(kTag, "RX begin failed: register callbacks");
            releaseResources();
            return false;
        }
        if (rmt_enable(rxChannel_) != ESP_OK)
        {
            ESP_LOGE(kTag, "RX begin failed: rmt_enable");
            releaseResources();
            return false;
        }

        // Idle timeout ends a burst; capped by what a 15-bit symbol can hold at this resolution.
        uint64_t maxRangeNs = static_cast<uint64_t>(kRmtMaxSymbolTicks) * 1000000000ULL / resolutionHz_;
        uint64_t idleNs = std::min<uint64_t>(static_cast<uint64_t>(idleTimeoutUs_) * 1000ULL, maxRangeNs);
        if (idleNs < static_cast<uint64_t>(idleTimeoutUs_) * 1000ULL)
        {
            ESP_LOGW(kTag, "RX idle timeout clamped to %u us by RMT range", static_cast<unsigned>(idleNs / 1000));
        }
        rxConfig_.signal_range_min_ns = kGlitchFilterNs;
        rxConfig_.signal_range_max_ns = static_cast<uint32_t>(idleNs);
        if (rmt_receive(rxChannel_, rxBuffer_, sizeof(rxBuffer_), &rxConfig_) != ESP_OK)
        {
            ESP_LOGE(kTag, "RX begin failed: rmt_receive");
            releaseResources();
            return false;
        }

        esp_timer_create_args_t timerArgs = {};
        timerArgs.callback = &Receiver::pollTimerCallback;
        timerArgs.arg = this;
        timerArgs.dispatch_method = ESP_TIMER_TASK;
        timerArgs.name = "necir_poll";
        timerArgs.skip_unhandled_events = true;
        if (esp_timer_create(&timerArgs, &pollTimer_) != ESP_OK)
        {
            ESP_LOGE(kTag, "RX begin failed: esp_timer_create");
            pollTimer_ = nullptr;
            releaseResources();
            return false;
        }
        if (esp_timer_start_periodic(pollTimer_, 1000000ULL / pollHz_) != ESP_OK)
        {
            ESP_LOGE(kTag, "RX begin failed: esp_timer_start_periodic");
            releaseResources();
            return false;
        }

        ESP_LOGD(kTag, "RX init version=%s pin=%d commandRepeat=%s strictHeader=%s resolutionHz=%u idleUs=%u pollHz=%u",
                 NECIR_VERSION_STR,
                 rxPin_,
                 commandRepeat_ ? "true" : "false",
                 strictHeader_ ? "true" : "false",
                 static_cast<unsigned>(resolutionHz_),
                 static_cast<unsigned>(idleNs / 1000),
                 static_cast<unsigned>(pollHz_));
        begun_ = true;
        ESP_LOGI(kTag, "RX begin: pin=%d commandRepeat=%s", rxPin_, commandRepeat_ ? "true" : "false");
        return true;
    }

    void Receiver::end()
    {
        if (!begun_)
        {
            return;
        }
        releaseResources();
        acquisition_.reset();
        rxOverflowed_ = false;
        rxNeedRestart_ = false;
        begun_ = false;
        ESP_LOGI(kTag, "RX end");
    }

    bool Receiver::decode()
    {
        if (!begun_)
        {
            ESP_LOGW(kTag, "RX decode called before begin");
            return false;
        }
        if (rxOverflowed_)
        {
            rxOverflowed_ = false;
            ESP_LOGW(kTag, "RX pulse queue full; values dropped");
        }
        if (rxNeedRestart_)
        {
            esp_err_t err = rmt_receive(rxChannel_, rxBuffer_, sizeof(rxBuffer_), &rxConfig_);
            if (err == ESP_OK)
            {
                rxNeedRestart_ = false;
            }
            else
            {
                ESP_LOGW(kTag, "RX rmt_receive restart failed err=%d", static_cast<int>(err));
            }
        }
        uint32_t overflows = acquisition_.overflowCount();
        if (overflows != lastOverflowCount_)
        {
            ESP_LOGW(kTag, "RX burst exceeded %u values; dropped (total=%u)",
                     static_cast<unsigned>(necir::kMaxBurstValues), static_cast<unsigned>(overflows));
            lastOverflowCount_ = overflows;
        }

        bool attempted = acquisition_.commandReady() || acquisition_.repeatReady();
        if (decoder_.decode())
        {
            ESP_LOGV(kTag, "RX code=0x%08X repeat=%s",
                     static_cast<unsigned>(decoder_.commandCode()), decoder_.isRepeat() ? "true" : "false");
            return true;
        }
        if (attempted && decoder_.lastError() != necir::DecodeError::None)
        {
            ESP_LOGD(kTag, "RX frame rejected: %s", necir::decodeErrorName(decoder_.lastError()));
        }
        return false;
    }

} // namespace necir
