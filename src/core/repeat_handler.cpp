#include "nec_decode.h"
#include "nec_timing.h"

namespace necir
{

    necir::DecodeError applyRepeat(const necir::Burst &burst, bool commandRepeat, uint32_t &code)
    {
        if (burst.size() < 2)
        {
            return necir::DecodeError::InsufficientData;
        }
        if (!necir::matches(burst[0], kHdrMarkUs) || !necir::matches(burst[1], kRepeatSpaceUs))
        {
            return necir::DecodeError::InvalidRepeatFrame;
        }
        // Held key: either keep reporting the last command or flag a bare repeat.
        if (!commandRepeat)
        {
            code = necir::kRepeatCode;
        }
        return necir::DecodeError::None;
    }

} // namespace necir
