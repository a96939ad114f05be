#include "remote_keys.h"

namespace necir
{
namespace keys
{

    namespace
    {
        struct KeyEntry
        {
            uint32_t code;
            const char *name;
        };

        constexpr KeyEntry kKeyTable[] = {
            {kKey0, "0"},
            {kKey1, "1"},
            {kKey2, "2"},
            {kKey3, "3"},
            {kKey4, "4"},
            {kKey5, "5"},
            {kKey6, "6"},
            {kKey7, "7"},
            {kKey8, "8"},
            {kKey9, "9"},
            {kKeyAsterisk, "*"},
            {kKeyPound, "#"},
            {kKeyUp, "UP"},
            {kKeyDown, "DOWN"},
            {kKeyLeft, "LEFT"},
            {kKeyRight, "RIGHT"},
            {kKeyOk, "OK"},
            {necir::kRepeatCode, "REPEAT"},
        };
    } // namespace

    const char *keyName(uint32_t code)
    {
        for (const auto &entry : kKeyTable)
        {
            if (entry.code == code)
                return entry.name;
        }
        return nullptr;
    }

} // namespace keys
} // namespace necir
