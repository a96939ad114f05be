#pragma once

#include "nec_types.h"

namespace necir
{
  // Decode a finalized command burst (microseconds) into a 32-bit code.
  // The first data pair lands in bit 31; a full 32-pair NEC frame fills the
  // whole word MSB-first, shorter frames leave the low bits zero.
  // With strictHeader=false a start sequence is only rejected when both the
  // 9 ms mark and the 4.5 ms space are off.
  // codeOut is written only on success.
  necir::DecodeError decodeFrame(const necir::Burst &burst, uint32_t &codeOut, bool strictHeader = false);

  // Validate a repeat burst (9 ms mark, 2.25 ms space) and apply the repeat
  // policy to code: commandRepeat keeps it, otherwise it becomes kRepeatCode.
  necir::DecodeError applyRepeat(const necir::Burst &burst, bool commandRepeat, uint32_t &code);

} // namespace necir
