#include "parser/line_source.hpp"

namespace logictest {

LineSource::LineSource(std::istream& input)
    : input_(input) {}

bool LineSource::next_line(std::string& line) {
    if (!std::getline(input_, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    ++line_number_;
    return true;
}

} // namespace logictest
