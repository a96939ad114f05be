#pragma once

#include "nec_types.h"
#include "pulse_acquisition.h"

namespace necir
{

  // Poll-side facade: turns pending bursts into the current command code.
  class Decoder
  {
  public:
    explicit Decoder(necir::AcquisitionBuffer &acquisition, bool commandRepeat = false, bool strictHeader = false);

    // Non-blocking. True when a new command (or an accepted repeat) is available.
    bool decode();

    uint32_t commandCode() const { return commandCode_; }
    void clearCommandCode() { commandCode_ = 0; }

    bool isRepeat() const { return repeat_; }
    necir::DecodeError lastError() const { return lastError_; }

    bool commandRepeat() const { return commandRepeat_; }
    void setCommandRepeat(bool commandRepeat) { commandRepeat_ = commandRepeat; }
    bool strictHeader() const { return strictHeader_; }
    void setStrictHeader(bool strictHeader) { strictHeader_ = strictHeader; }

  private:
    necir::AcquisitionBuffer &acquisition_;
    bool commandRepeat_{false};
    bool strictHeader_{false};
    uint32_t commandCode_{0};
    bool repeat_{false};
    necir::DecodeError lastError_{necir::DecodeError::None};
    necir::Burst scratch_{};
  };

} // namespace necir
