#include "SignalClassifier.hpp"

#include <utf8proc.h>

namespace processing
{

namespace
{
constexpr utf8proc_int32_t kVariationSelector16 = 0xFE0F;
}

bool isExtendedPictographic(char32_t cp)
{
    if (cp == 0 || cp > 0x10FFFF)
        return false;
    const utf8proc_property_t* prop = utf8proc_get_property(static_cast<utf8proc_int32_t>(cp));
    return prop && prop->boundclass == UTF8PROC_BOUNDCLASS_EXTENDED_PICTOGRAPHIC;
}

char32_t extractSymbol(std::string_view text, std::string* symbol)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            ++pos;
            continue;
        }

        if (!isExtendedPictographic(static_cast<char32_t>(codepoint)))
        {
            pos += bytes;
            continue;
        }

        utf8proc_ssize_t end = pos + bytes;
        if (end < len)
        {
            utf8proc_int32_t next = 0;
            utf8proc_ssize_t next_bytes = utf8proc_iterate(str + end, len - end, &next);
            if (next_bytes > 0 && next == kVariationSelector16)
                end += next_bytes;
        }

        if (symbol)
            symbol->assign(text.substr(static_cast<size_t>(pos), static_cast<size_t>(end - pos)));
        return static_cast<char32_t>(codepoint);
    }

    if (symbol)
        symbol->clear();
    return 0;
}

SignalClassification classify(std::string_view text)
{
    SignalClassification result;
    result.color = kDefaultAccentColor;
    result.code_point = extractSymbol(text, &result.symbol);
    if (!result.hasSymbol())
        return result;

    if (const SignalEntry* entry = findSignal(result.code_point))
    {
        result.category = entry->category;
        result.alert = entry->alert;
        result.group = entry->group;
        result.color = paletteColor(entry->group);
    }
    return result;
}

const char* categoryName(SignalCategory category)
{
    switch (category)
    {
    case SignalCategory::Working:
        return "working";
    case SignalCategory::Idle:
        return "idle";
    case SignalCategory::None:
        break;
    }
    return "none";
}

} // namespace processing
