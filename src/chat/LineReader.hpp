#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chat
{

/**
 * @brief Incremental '\n' splitter for a byte stream read in arbitrary chunks
 *
 * feed() returns every line completed by the chunk, in order, without the
 * terminator (a trailing '\r' is dropped too). The unterminated tail is kept
 * as the remainder and is never returned until a later chunk completes it.
 * At end of stream finish() hands the leftover back so the caller decides
 * what an unterminated line means.
 *
 * With a non-zero max_line_bytes, a line growing past the limit is dropped
 * whole: input is skipped up to and including its '\n', and droppedLines()
 * counts it.
 */
class LineReader
{
public:
    explicit LineReader(std::size_t max_line_bytes = 0)
        : max_line_bytes_(max_line_bytes)
    {
    }

    std::vector<std::string> feed(std::string_view chunk);

    // End of stream: returns the non-empty remainder, if any, and clears it.
    std::optional<std::string> finish();

    const std::string& remainder() const { return remainder_; }
    std::size_t droppedLines() const { return dropped_lines_; }
    void reset();

private:
    bool tooLong(std::size_t size) const { return max_line_bytes_ > 0 && size > max_line_bytes_; }

    std::size_t max_line_bytes_ = 0;
    std::string remainder_;
    bool skipping_ = false;
    std::size_t dropped_lines_ = 0;
};

} // namespace chat
