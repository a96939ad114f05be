#ifndef NECIRDECODER_H
#define NECIRDECODER_H

#include <Arduino.h>
#include <stddef.h>
#include <stdint.h>
#ifndef ESP_PLATFORM
#error "NecIRDecoder receiver is intended for ESP32 (ESP_PLATFORM must be defined)."
#endif

#include "necir_version.h"
#include "core/nec_types.h"
#include "core/nec_decode.h"
#include "core/pulse_acquisition.h"
#include "core/pulse_forward.h"
#include "core/decoder.h"
#include "core/remote_keys.h"
#include <driver/rmt_rx.h>
#include <esp_timer.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

namespace necir
{

  // PulseSource backed by the FreeRTOS queue the RMT receive ISR fills.
  class QueuePulseSource : public necir::PulseSource
  {
  public:
    QueuePulseSource() = default;

    void attach(QueueHandle_t queue, uint32_t frequencyHz)
    {
      queue_ = queue;
      frequencyHz_ = frequencyHz;
    }
    void detach() { queue_ = nullptr; }

    bool read(uint32_t &ticks) override;
    uint32_t frequencyHz() const override { return frequencyHz_; }

  private:
    QueueHandle_t queue_{nullptr};
    uint32_t frequencyHz_{0};
  };

  // Receiver
  class Receiver
  {
  public:
    Receiver();
    explicit Receiver(int rxPin, bool commandRepeat = false);
    ~Receiver();

    Receiver(const Receiver &) = delete;
    Receiver &operator=(const Receiver &) = delete;

    bool setPin(int rxPin);
    bool setCommandRepeat(bool commandRepeat);
    bool setStrictHeader(bool strictHeader);
    bool setResolutionHz(uint32_t resolutionHz);
    bool setIdleTimeoutUs(uint32_t idleTimeoutUs);
    bool setPollHz(uint32_t pollHz);

    bool begin();
    void end();

    // Non-blocking; true when commandCode() holds a new command or an accepted repeat.
    bool decode();

    uint32_t commandCode() const { return decoder_.commandCode(); }
    void clearCommandCode() { decoder_.clearCommandCode(); }
    bool isRepeat() const { return decoder_.isRepeat(); }
    necir::DecodeError lastError() const { return decoder_.lastError(); }

    struct RxCallbackContext
    {
      QueueHandle_t queue;
      UBaseType_t queueLength;
      rmt_channel_handle_t channel;
      rmt_symbol_word_t *buffer;
      size_t bufferLenSymbols;
      const rmt_receive_config_t *rxConfig;
      volatile bool *overflowFlag;
      volatile bool *needRestart;
    };

  private:
    static constexpr size_t kRxBufferSymbols = 64;

    static void pollTimerCallback(void *arg);
    void waitForTimerTask();
    void releaseResources();

    int rxPin_{-1};
    bool commandRepeat_{false};
    bool strictHeader_{false};
    uint32_t resolutionHz_{1000000};
    uint32_t idleTimeoutUs_{20000};
    uint32_t pollHz_{4000};
    bool begun_{false};
    rmt_channel_handle_t rxChannel_{nullptr};
    QueueHandle_t pulseQueue_{nullptr};
    esp_timer_handle_t pollTimer_{nullptr};
    rmt_symbol_word_t rxBuffer_[kRxBufferSymbols]{};
    rmt_receive_config_t rxConfig_{};
    RxCallbackContext rxCallbackCtx_{};
    volatile bool rxOverflowed_{false};
    volatile bool rxNeedRestart_{false};
    uint32_t lastOverflowCount_{0};
    necir::QueuePulseSource source_;
    necir::AcquisitionBuffer acquisition_{source_};
    necir::Decoder decoder_{acquisition_};
  };

} // namespace necir

#endif // NECIRDECODER_H
