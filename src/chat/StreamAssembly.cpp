#include "StreamAssembly.hpp"

#include <plog/Log.h>

namespace chat
{

void StreamAssembly::collect(const std::string& line, std::vector<StreamRecord>& out)
{
    StreamRecord record = parseStreamLine(line);
    switch (record.kind)
    {
    case RecordKind::Skip:
        break;
    case RecordKind::Malformed:
        PLOG_WARNING << "Skipping unparseable stream record: " << record.text;
        break;
    case RecordKind::Done:
        saw_done_ = true;
        break;
    case RecordKind::Content:
    case RecordKind::Error:
        out.push_back(std::move(record));
        break;
    }
}

std::vector<StreamRecord> StreamAssembly::feed(std::string_view chunk)
{
    std::vector<StreamRecord> records;
    for (const auto& line : reader_.feed(chunk))
    {
        collect(line, records);
    }
    return records;
}

void StreamAssembly::finish()
{
    if (auto last = reader_.finish())
    {
        PLOG_DEBUG << "Discarding unterminated stream tail (" << last->size() << " bytes): " << *last;
    }
}

void StreamAssembly::reset()
{
    reader_.reset();
    text_.clear();
    saw_done_ = false;
}

} // namespace chat
