#include "nec_decode.h"
#include "nec_timing.h"

namespace necir
{

    namespace
    {
        constexpr uint32_t kMaxDataPairs = 32;

        bool startSequenceOk(const necir::Burst &burst, bool strictHeader)
        {
            bool markOk = necir::matches(burst[0], kHdrMarkUs);
            bool spaceOk = necir::matches(burst[1], kHdrSpaceUs);
            if (strictHeader)
                return markOk && spaceOk;
            return markOk || spaceOk;
        }
    } // namespace

    necir::DecodeError decodeFrame(const necir::Burst &burst, uint32_t &codeOut, bool strictHeader)
    {
        const size_t len = burst.size();
        if (len <= 1)
        {
            return necir::DecodeError::InsufficientData;
        }
        if (!startSequenceOk(burst, strictHeader))
        {
            return necir::DecodeError::InvalidStartSequence;
        }
        if ((len - 2) / 2 > kMaxDataPairs)
        {
            return necir::DecodeError::FrameTooLong;
        }
        uint32_t code = 0;
        for (size_t i = 2; i + 1 < len; i += 2)
        {
            uint32_t mark = burst[i];
            uint32_t space = burst[i + 1];
            if (static_cast<uint64_t>(mark) + space > kOneSpaceUs)
            {
                if (!necir::isOneBit(mark, space))
                    return necir::DecodeError::InvalidOneBit;
                const uint32_t pairIndex = static_cast<uint32_t>(i / 2);
                code |= uint32_t{1} << (31 - (pairIndex - 1));
            }
            else if (!necir::isZeroBit(mark, space))
            {
                return necir::DecodeError::InvalidZeroBit;
            }
        }
        codeOut = code;
        return necir::DecodeError::None;
    }

    const char *decodeErrorName(necir::DecodeError err)
    {
        switch (err)
        {
        case necir::DecodeError::None:
            return "None";
        case necir::DecodeError::InsufficientData:
            return "InsufficientData";
        case necir::DecodeError::InvalidStartSequence:
            return "InvalidStartSequence";
        case necir::DecodeError::InvalidZeroBit:
            return "InvalidZeroBit";
        case necir::DecodeError::InvalidOneBit:
            return "InvalidOneBit";
        case necir::DecodeError::InvalidRepeatFrame:
            return "InvalidRepeatFrame";
        case necir::DecodeError::FrameTooLong:
            return "FrameTooLong";
        default:
            return "UNKNOWN";
        }
    }

} // namespace necir
