#pragma once

#include "LineReader.hpp"
#include "StreamRecord.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace chat
{

// Per-turn reconstruction of the assistant text from raw body chunks.
// Records come back in arrival order; the caller applies Content records with
// append() so it can re-render between fragments.
class StreamAssembly
{
public:
    // Blank, non-data and field-less lines are dropped here; malformed
    // records are logged and dropped.
    std::vector<StreamRecord> feed(std::string_view chunk);

    // End of stream. An unterminated last line was never completed, so it is
    // discarded rather than parsed.
    void finish();

    void append(const std::string& fragment) { text_ += fragment; }

    const std::string& text() const { return text_; }
    bool hasContent() const { return !text_.empty(); }
    const std::string& remainder() const { return reader_.remainder(); }
    bool sawDone() const { return saw_done_; }

    void reset();

private:
    void collect(const std::string& line, std::vector<StreamRecord>& out);

    LineReader reader_;
    std::string text_;
    bool saw_done_ = false;
};

} // namespace chat
