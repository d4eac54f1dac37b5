#pragma once

#include <string>
#include <string_view>

namespace chat
{

enum class RecordKind
{
    Content,   // a text fragment to append
    Error,     // the server reported an error inside the stream
    Done,      // "[DONE]" sentinel
    Skip,      // blank, not a data line, or a record without usable fields
    Malformed  // data line whose payload is not valid JSON
};

struct StreamRecord
{
    RecordKind kind = RecordKind::Skip;
    std::string text; // fragment, error message, or the offending payload
};

// Parses one complete line of a "data: <json>" stream. Payload fields are
// looked up in order: choices[0].delta.content, message.content, error.
// Empty strings do not count as content.
StreamRecord parseStreamLine(std::string_view line);

} // namespace chat
