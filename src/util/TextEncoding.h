#pragma once

// util/TextEncoding.h
// -------------------
// Helpers for text files users may have hand-edited (config.ini, highscores.json).
//
// Some editors save with a UTF-8 BOM, which strict parsers (nlohmann::json)
// reject. UTF-16 files are not converted; they are reported as unusable.

#include <string>
#include <string_view>

namespace minefield::util {

[[nodiscard]] inline bool HasUtf16Bom(std::string_view bytes) noexcept
{
    if (bytes.size() < 2)
        return false;

    const unsigned char b0 = static_cast<unsigned char>(bytes[0]);
    const unsigned char b1 = static_cast<unsigned char>(bytes[1]);
    return (b0 == 0xFFu && b1 == 0xFEu) || (b0 == 0xFEu && b1 == 0xFFu);
}

// Strips a leading UTF-8 BOM (EF BB BF) in place.
// Returns false if the text is UTF-16 (BOM-marked) and cannot be parsed as UTF-8.
inline bool NormalizeTextToUtf8(std::string& bytes)
{
    if (bytes.size() >= 3)
    {
        const unsigned char b0 = static_cast<unsigned char>(bytes[0]);
        const unsigned char b1 = static_cast<unsigned char>(bytes[1]);
        const unsigned char b2 = static_cast<unsigned char>(bytes[2]);

        if (b0 == 0xEFu && b1 == 0xBBu && b2 == 0xBFu)
        {
            bytes.erase(0, 3);
            return true;
        }
    }

    return !HasUtf16Bom(bytes);
}

} // namespace minefield::util
