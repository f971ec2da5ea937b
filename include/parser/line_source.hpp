#pragma once

#include <istream>
#include <string>

namespace logictest {

/**
 * @brief Forward-only line reader with a 1-based line counter
 *
 * Wraps an input stream. Once a line is consumed it cannot be re-read.
 * A trailing '\r' is dropped so CRLF files parse like LF files.
 *
 * Usage:
 *   LineSource source(stream);
 *   std::string line;
 *   while (source.next_line(line)) {
 *       handle(line, source.line_number());
 *   }
 */
class LineSource {
public:
    explicit LineSource(std::istream& input);

    /**
     * @brief Read the next line
     * @param line Receives the line text without its terminator
     * @return false at end of input
     */
    bool next_line(std::string& line);

    /** @brief Number of lines consumed so far */
    [[nodiscard]] int line_number() const { return line_number_; }

    /** @brief True if the underlying stream failed for a reason other than EOF */
    [[nodiscard]] bool has_error() const { return input_.bad(); }

private:
    std::istream& input_;
    int line_number_ = 0;
};

} // namespace logictest
