#include "StreamRecord.hpp"

#include <nlohmann/json.hpp>

namespace chat
{

namespace
{

constexpr std::string_view kDataPrefix = "data: ";
constexpr std::string_view kDoneSentinel = "[DONE]";

std::string_view trim(std::string_view s)
{
    const char* ws = " \t\r\n\f\v";
    std::size_t b = s.find_first_not_of(ws);
    if (b == std::string_view::npos)
        return {};
    std::size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

const std::string* nonEmptyString(const nlohmann::json& j)
{
    if (!j.is_string())
        return nullptr;
    const auto& s = j.get_ref<const std::string&>();
    return s.empty() ? nullptr : &s;
}

std::string errorText(const nlohmann::json& err)
{
    if (err.is_string())
        return err.get<std::string>();
    if (err.is_object())
    {
        auto it = err.find("message");
        if (it != err.end() && it->is_string())
            return it->get<std::string>();
    }
    return err.dump();
}

} // namespace

StreamRecord parseStreamLine(std::string_view line)
{
    std::string_view trimmed = trim(line);
    if (trimmed.size() < kDataPrefix.size() || trimmed.substr(0, kDataPrefix.size()) != kDataPrefix)
        return {};

    std::string_view payload = trim(trimmed.substr(kDataPrefix.size()));
    if (payload == kDoneSentinel)
        return { RecordKind::Done, {} };

    nlohmann::json j = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
    if (j.is_discarded())
        return { RecordKind::Malformed, std::string(payload) };

    if (!j.is_object())
        return {};

    auto choices = j.find("choices");
    if (choices != j.end() && choices->is_array() && !choices->empty())
    {
        const auto& first = (*choices)[0];
        if (first.is_object())
        {
            auto delta = first.find("delta");
            if (delta != first.end() && delta->is_object())
            {
                auto content = delta->find("content");
                if (content != delta->end())
                {
                    if (const std::string* s = nonEmptyString(*content))
                        return { RecordKind::Content, *s };
                }
            }
        }
    }

    auto message = j.find("message");
    if (message != j.end() && message->is_object())
    {
        auto content = message->find("content");
        if (content != message->end())
        {
            if (const std::string* s = nonEmptyString(*content))
                return { RecordKind::Content, *s };
        }
    }

    auto err = j.find("error");
    if (err != j.end() && !err->is_null())
        return { RecordKind::Error, errorText(*err) };

    return {};
}

} // namespace chat
