#include "decoder.h"
#include "nec_decode.h"

namespace necir
{

    Decoder::Decoder(necir::AcquisitionBuffer &acquisition, bool commandRepeat, bool strictHeader)
        : acquisition_(acquisition), commandRepeat_(commandRepeat), strictHeader_(strictHeader) {}

    bool Decoder::decode()
    {
        if (acquisition_.takeCommand(scratch_))
        {
            uint32_t code = 0;
            lastError_ = necir::decodeFrame(scratch_, code, strictHeader_);
            if (lastError_ != necir::DecodeError::None)
            {
                return false;
            }
            commandCode_ = code;
            repeat_ = false;
            return true;
        }
        if (acquisition_.takeRepeat(scratch_))
        {
            // A command that slipped in after the check above is superseded by the repeat.
            acquisition_.discardCommand();
            lastError_ = necir::applyRepeat(scratch_, commandRepeat_, commandCode_);
            if (lastError_ != necir::DecodeError::None)
            {
                return false;
            }
            repeat_ = true;
            return true;
        }
        return false;
    }

} // namespace necir
