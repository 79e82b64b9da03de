#include "edit_distance.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace escapelint
{
    namespace
    {
        constexpr char32_t kReplacementCharacter = 0xFFFD;

        bool isContinuation(unsigned char byte)
        {
            return (byte & 0xC0) == 0x80;
        }
    } // namespace

    std::u32string decodeUtf8(std::string_view text)
    {
        std::u32string decoded;
        decoded.reserve(text.size());

        std::size_t index = 0;
        while (index < text.size())
        {
            const auto lead = static_cast<unsigned char>(text[index]);
            if (lead < 0x80)
            {
                decoded.push_back(lead);
                ++index;
                continue;
            }

            std::size_t length = 0;
            char32_t codePoint = 0;
            char32_t minimum = 0;
            if ((lead & 0xE0) == 0xC0)
            {
                length = 2;
                codePoint = lead & 0x1F;
                minimum = 0x80;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                length = 3;
                codePoint = lead & 0x0F;
                minimum = 0x800;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                length = 4;
                codePoint = lead & 0x07;
                minimum = 0x10000;
            }
            else
            {
                decoded.push_back(kReplacementCharacter);
                ++index;
                continue;
            }

            bool wellFormed = index + length <= text.size();
            for (std::size_t offset = 1; wellFormed && offset < length; ++offset)
            {
                const auto byte = static_cast<unsigned char>(text[index + offset]);
                if (!isContinuation(byte))
                {
                    wellFormed = false;
                    break;
                }
                codePoint = (codePoint << 6) | (byte & 0x3F);
            }

            if (wellFormed
                && (codePoint < minimum || codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)))
            {
                wellFormed = false;
            }

            if (!wellFormed)
            {
                // Replace the lead byte and any continuation bytes that follow it.
                decoded.push_back(kReplacementCharacter);
                ++index;
                while (index < text.size() && isContinuation(static_cast<unsigned char>(text[index])))
                {
                    decoded.push_back(kReplacementCharacter);
                    ++index;
                }
                continue;
            }

            decoded.push_back(codePoint);
            index += length;
        }

        return decoded;
    }

    std::size_t editDistance(std::string_view lhs, std::string_view rhs)
    {
        std::u32string longer = decodeUtf8(lhs);
        std::u32string shorter = decodeUtf8(rhs);
        if (longer.size() < shorter.size())
        {
            std::swap(longer, shorter);
        }

        std::vector<std::size_t> previous(shorter.size() + 1);
        std::vector<std::size_t> current(shorter.size() + 1);
        for (std::size_t column = 0; column < previous.size(); ++column)
        {
            previous[column] = column;
        }

        for (std::size_t row = 0; row < longer.size(); ++row)
        {
            current[0] = row + 1;
            for (std::size_t column = 0; column < shorter.size(); ++column)
            {
                const std::size_t insertion = previous[column + 1] + 1;
                const std::size_t deletion = current[column] + 1;
                const std::size_t substitution = previous[column] + (longer[row] == shorter[column] ? 0 : 1);
                current[column + 1] = std::min({insertion, deletion, substitution});
            }
            std::swap(previous, current);
        }

        return previous[shorter.size()];
    }

    bool isNearMiss(std::string_view lhs, std::string_view rhs, std::size_t threshold)
    {
        return editDistance(lhs, rhs) <= threshold;
    }
} // namespace escapelint
