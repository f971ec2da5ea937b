#include "runner/result_verifier.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <format>
#include <numeric>
#include <stdexcept>

namespace logictest {

namespace {

bool only_chars(const std::string& s, std::string_view allowed) {
    return !s.empty() && s.find_first_not_of(allowed) == std::string::npos;
}

std::vector<std::string> sort_rows(std::vector<std::string> values, size_t num_cols) {
    if (num_cols == 0) {
        throw std::invalid_argument("rowsort requires at least one result column");
    }
    if (values.size() % num_cols != 0) {
        throw std::invalid_argument(std::format(
            "{} values cannot be split into rows of {} columns", values.size(), num_cols));
    }

    const size_t num_rows = values.size() / num_cols;
    std::vector<size_t> order(num_rows);
    std::iota(order.begin(), order.end(), 0);

    const auto row_less = [&values, num_cols](size_t a, size_t b) {
        const auto row_a = values.begin() + static_cast<std::ptrdiff_t>(a * num_cols);
        const auto row_b = values.begin() + static_cast<std::ptrdiff_t>(b * num_cols);
        return std::lexicographical_compare(
            row_a, row_a + static_cast<std::ptrdiff_t>(num_cols),
            row_b, row_b + static_cast<std::ptrdiff_t>(num_cols));
    };
    std::stable_sort(order.begin(), order.end(), row_less);

    std::vector<std::string> sorted;
    sorted.reserve(values.size());
    for (const size_t row : order) {
        for (size_t col = 0; col < num_cols; ++col) {
            sorted.push_back(std::move(values[row * num_cols + col]));
        }
    }
    return sorted;
}

} // anonymous namespace

const char* verify_status_to_string(VerifyStatus status) {
    switch (status) {
        case VerifyStatus::PASS: return "pass";
        case VerifyStatus::SCHEMA_MISMATCH: return "schema mismatch";
        case VerifyStatus::COUNT_MISMATCH: return "count mismatch";
        case VerifyStatus::VALUE_MISMATCH: return "value mismatch";
        case VerifyStatus::HASH_MISMATCH: return "hash mismatch";
        default: return "unknown";
    }
}

// ============================================================================
// Sorting
// ============================================================================

std::vector<std::string> sort_results(const Record& record, std::vector<std::string> values) {
    switch (record.sort_mode()) {
        case SortMode::NO_SORT:
            return values;
        case SortMode::ROW_SORT:
            return sort_rows(std::move(values), record.num_cols());
        case SortMode::VALUE_SORT:
            std::sort(values.begin(), values.end());
            return values;
    }
    throw std::invalid_argument("Unrecognized sort mode");
}

// ============================================================================
// Hashing
// ============================================================================

std::string hash_results(const std::vector<std::string>& values) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    bool ok = EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) == 1;
    for (const auto& value : values) {
        if (!ok) break;
        ok = EVP_DigestUpdate(ctx, value.data(), value.size()) == 1 &&
             EVP_DigestUpdate(ctx, "\n", 1) == 1;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (ok) {
        ok = EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
    }
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("MD5 digest of results failed");
    }

    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex += std::format("{:02x}", digest[i]);
    }
    return hex;
}

// ============================================================================
// Verification
// ============================================================================

bool schema_matches(const std::string& expected, const std::string& observed, size_t expected_count) {
    if (expected == observed) {
        return true;
    }
    return expected_count == 0 &&
           expected.size() == observed.size() &&
           only_chars(expected, "I") &&
           only_chars(observed, "IR");
}

VerifyOutcome verify_results(
    const Record& record,
    const std::string& observed_schema,
    const std::vector<std::string>& observed_values) {

    const size_t expected_count = record.num_results();
    if (observed_values.size() != expected_count) {
        return {VerifyStatus::COUNT_MISMATCH, std::format(
            "Incorrect number of results. Expected {}, got {}",
            expected_count, observed_values.size())};
    }

    // Only one failure per record: a schema mismatch skips the value comparison
    if (!schema_matches(record.schema(), observed_schema, expected_count)) {
        return {VerifyStatus::SCHEMA_MISMATCH, std::format(
            "Schemas differ. Expected {}, got {}", record.schema(), observed_schema)};
    }

    const auto sorted = sort_results(record, observed_values);

    if (record.is_hash_result()) {
        const std::string expected_hash = record.hash_result();
        const std::string computed_hash = hash_results(sorted);
        if (expected_hash != computed_hash) {
            return {VerifyStatus::HASH_MISMATCH, std::format(
                "Hash of results differ. Expected {}, got {}", expected_hash, computed_hash)};
        }
        return {};
    }

    const auto& expected = record.result();
    for (size_t i = 0; i < expected.size(); ++i) {
        if (expected[i] != sorted[i]) {
            return {VerifyStatus::VALUE_MISMATCH, std::format(
                "Incorrect result at position {}. Expected {}, got {}", i, expected[i], sorted[i])};
        }
    }
    return {};
}

} // namespace logictest
