#include "case_fold.hpp"
#include "logger.hpp"

#include <locale>

namespace
{
    constexpr char32_t INVALID = 0xFFFFFFFF;

    // decode one code point starting at pos, advancing pos past it
    char32_t decode(std::string_view text, size_t &pos)
    {
        const auto byte = [&](size_t i)
        { return static_cast<unsigned char>(text[i]); };

        const unsigned char lead = byte(pos);
        size_t length;
        char32_t cp;
        char32_t min;
        if (lead < 0x80)
        {
            pos += 1;
            return lead;
        }
        else if ((lead & 0xE0) == 0xC0)
        {
            length = 2;
            cp = lead & 0x1F;
            min = 0x80;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            length = 3;
            cp = lead & 0x0F;
            min = 0x800;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            length = 4;
            cp = lead & 0x07;
            min = 0x10000;
        }
        else
        {
            return INVALID;
        }

        if (pos + length > text.size())
        {
            return INVALID;
        }
        for (size_t i = 1; i < length; ++i)
        {
            const unsigned char cont = byte(pos + i);
            if ((cont & 0xC0) != 0x80)
            {
                return INVALID;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        // overlong forms, surrogates and values past the Unicode range
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        {
            return INVALID;
        }
        pos += length;
        return cp;
    }

    void encode(char32_t cp, std::string &out)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    // locale used for lowercasing non-ASCII code points, loaded once
    const std::ctype<wchar_t> &unicodeCtype()
    {
        static const std::locale locale = []() -> std::locale
        {
            for (const char *name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"})
            {
                try
                {
                    return std::locale(name);
                }
                catch (const std::runtime_error &)
                {
                    // not installed, try the next one
                }
            }
            Logger::getInstance()->warning(
                "No UTF-8 locale available, case folding is limited to ASCII");
            return std::locale::classic();
        }();
        return std::use_facet<std::ctype<wchar_t>>(locale);
    }

    char32_t lower(char32_t cp)
    {
        if (cp < 0x80)
        {
            return (cp >= 'A' && cp <= 'Z') ? cp + ('a' - 'A') : cp;
        }
        static_assert(sizeof(wchar_t) == 4, "wchar_t must hold a full code point");
        const wchar_t lowered = unicodeCtype().tolower(static_cast<wchar_t>(cp));
        return static_cast<char32_t>(lowered);
    }
}

namespace CaseFold
{
    bool isValidUtf8(std::string_view text)
    {
        size_t pos = 0;
        while (pos < text.size())
        {
            if (decode(text, pos) == INVALID)
            {
                return false;
            }
        }
        return true;
    }

    std::optional<std::string> toLower(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());

        size_t pos = 0;
        while (pos < text.size())
        {
            const char32_t cp = decode(text, pos);
            if (cp == INVALID)
            {
                return std::nullopt;
            }
            encode(lower(cp), out);
        }
        return out;
    }

    std::string foldPath(const fs::path &path)
    {
        const std::string &native = path.native();
        auto folded = toLower(native);
        return folded ? std::move(*folded) : native;
    }
}
