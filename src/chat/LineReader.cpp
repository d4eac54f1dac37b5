#include "LineReader.hpp"

namespace chat
{

namespace
{
void stripCarriageReturn(std::string& line)
{
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
}
} // namespace

std::vector<std::string> LineReader::feed(std::string_view chunk)
{
    std::vector<std::string> lines;

    std::size_t start = 0;
    while (start <= chunk.size())
    {
        std::size_t nl = chunk.find('\n', start);
        if (skipping_)
        {
            // Rest of an oversized line
            if (nl == std::string_view::npos)
                break;
            skipping_ = false;
            start = nl + 1;
            continue;
        }

        if (nl == std::string_view::npos)
        {
            remainder_.append(chunk.substr(start));
            if (tooLong(remainder_.size()))
            {
                remainder_.clear();
                skipping_ = true;
                ++dropped_lines_;
            }
            break;
        }

        std::string line = std::move(remainder_);
        remainder_.clear();
        line.append(chunk.substr(start, nl - start));
        start = nl + 1;

        stripCarriageReturn(line);
        if (tooLong(line.size()))
        {
            ++dropped_lines_;
            continue;
        }
        lines.push_back(std::move(line));
    }

    return lines;
}

std::optional<std::string> LineReader::finish()
{
    skipping_ = false;
    if (remainder_.empty())
        return std::nullopt;

    std::string line = std::move(remainder_);
    remainder_.clear();
    stripCarriageReturn(line);
    return line;
}

void LineReader::reset()
{
    remainder_.clear();
    skipping_ = false;
}

} // namespace chat
