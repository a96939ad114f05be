#pragma once

#include "nec_types.h"

namespace necir
{
  // Codes of the stock 17-key NEC remote (address 0x00, MSB-first 32-bit frame).
  namespace keys
  {
    constexpr uint32_t kKey0 = 0x00FF9867;
    constexpr uint32_t kKey1 = 0x00FFA25D;
    constexpr uint32_t kKey2 = 0x00FF629D;
    constexpr uint32_t kKey3 = 0x00FFE21D;
    constexpr uint32_t kKey4 = 0x00FF22DD;
    constexpr uint32_t kKey5 = 0x00FF02FD;
    constexpr uint32_t kKey6 = 0x00FFC23D;
    constexpr uint32_t kKey7 = 0x00FFE01F;
    constexpr uint32_t kKey8 = 0x00FFA857;
    constexpr uint32_t kKey9 = 0x00FF906F;
    constexpr uint32_t kKeyAsterisk = 0x00FF6897;
    constexpr uint32_t kKeyPound = 0x00FFB04F;
    constexpr uint32_t kKeyUp = 0x00FF18E7;
    constexpr uint32_t kKeyDown = 0x00FF4AB5;
    constexpr uint32_t kKeyLeft = 0x00FF10EF;
    constexpr uint32_t kKeyRight = 0x00FF5AA5;
    constexpr uint32_t kKeyOk = 0x00FF38C7;

    // Short label for a known code ("0".."9", "*", "#", "UP", ..., "REPEAT"); nullptr otherwise.
    const char *keyName(uint32_t code);
  } // namespace keys
} // namespace necir
