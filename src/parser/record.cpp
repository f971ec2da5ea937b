#include "parser/record.hpp"
#include "core/utils.hpp"

#include <stdexcept>

namespace logictest {

namespace {

constexpr std::string_view kHashMarker = " values hashing to ";

bool all_of_chars(std::string_view s, std::string_view allowed) {
    return !s.empty() && s.find_first_not_of(allowed) == std::string_view::npos;
}

} // anonymous namespace

const char* record_type_to_string(RecordType type) {
    switch (type) {
        case RecordType::STATEMENT: return "statement";
        case RecordType::QUERY: return "query";
        case RecordType::HALT: return "halt";
        default: return "unknown";
    }
}

std::string_view sort_mode_to_string(SortMode mode) {
    switch (mode) {
        case SortMode::NO_SORT: return "nosort";
        case SortMode::ROW_SORT: return "rowsort";
        case SortMode::VALUE_SORT: return "valuesort";
        default: return "nosort";
    }
}

std::optional<SortMode> parse_sort_mode(std::string_view token) {
    if (token == "nosort") return SortMode::NO_SORT;
    if (token == "rowsort") return SortMode::ROW_SORT;
    if (token == "valuesort") return SortMode::VALUE_SORT;
    return std::nullopt;
}

std::optional<HashSummary> parse_hash_summary(std::string_view line) {
    const std::string trimmed = utils::trim(std::string(line));
    const std::string_view sv(trimmed);

    const size_t marker = sv.find(kHashMarker);
    if (marker == std::string_view::npos) {
        return std::nullopt;
    }

    const std::string_view count_part = sv.substr(0, marker);
    const std::string_view digest_part = sv.substr(marker + kHashMarker.size());
    if (!all_of_chars(count_part, "0123456789") ||
        !all_of_chars(digest_part, "0123456789abcdef")) {
        return std::nullopt;
    }

    const auto count = utils::try_parse_int<size_t>(count_part);
    if (!count) {
        return std::nullopt;
    }
    return HashSummary{*count, std::string(digest_part)};
}

// ============================================================================
// Record
// ============================================================================

Record::Record(Data data)
    : data_(std::move(data)) {}

bool Record::is_hash_result() const {
    return data_.result.size() == 1 && parse_hash_summary(data_.result[0]).has_value();
}

std::string Record::hash_result() const {
    if (data_.result.size() == 1) {
        if (auto summary = parse_hash_summary(data_.result[0])) {
            return summary->digest;
        }
    }
    throw std::logic_error("Record does not have a hash result");
}

size_t Record::num_results() const {
    if (data_.type != RecordType::QUERY) {
        throw std::logic_error("Only query records have results");
    }
    if (data_.result.size() == 1) {
        if (auto summary = parse_hash_summary(data_.result[0])) {
            return summary->value_count;
        }
    }
    return data_.result.size();
}

size_t Record::num_cols() const {
    if (data_.type != RecordType::QUERY) {
        throw std::logic_error("Only query records have results");
    }
    return data_.schema.size();
}

} // namespace logictest
