#include "harness/connection_harness.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <format>

namespace logictest {

ConnectionHarness::ConnectionHarness(std::string engine,
                                     std::shared_ptr<IConnectionFactory> factory,
                                     std::string connection_string)
    : engine_(std::move(engine)),
      factory_(std::move(factory)),
      connection_string_(std::move(connection_string)) {}

HarnessResult ConnectionHarness::init() {
    if (!conn_ || !conn_->is_connected()) {
        conn_ = factory_->create(connection_string_);
        if (!conn_) {
            return HarnessResult::error(std::format("{}: could not connect", engine_));
        }
    }

    for (const auto& sql : reset_statements()) {
        const auto result = conn_->execute(sql);
        if (!result.success) {
            return HarnessResult::error(
                std::format("{}: reset failed on '{}': {}", engine_, sql, result.error_message));
        }
    }
    return HarnessResult::ok();
}

HarnessResult ConnectionHarness::execute_statement(const std::string& statement) {
    if (!conn_) {
        return HarnessResult::error("harness not initialized");
    }
    const auto result = conn_->execute(statement);
    if (!result.success) {
        return HarnessResult::error(result.error_message);
    }
    return HarnessResult::ok();
}

HarnessResult ConnectionHarness::execute_query(const std::string& query) {
    if (!conn_) {
        return HarnessResult::error("harness not initialized");
    }
    const auto result = conn_->execute(query);
    if (!result.success) {
        return HarnessResult::error(result.error_message);
    }
    return to_harness_result(result);
}

// ============================================================================
// Value rendering
// ============================================================================

std::string ConnectionHarness::render_value(const DbValue& value, char type_tag) {
    if (!value) {
        return "NULL";
    }
    if (value->empty()) {
        return "(empty)";
    }
    if (type_tag == kRealTag) {
        double d = 0.0;
        const auto* begin = value->data();
        const auto* end = begin + value->size();
        const auto [ptr, ec] = std::from_chars(begin, end, d);
        if (ec == std::errc{} && ptr == end) {
            return std::format("{:.3f}", d);
        }
    }
    return *value;
}

HarnessResult ConnectionHarness::to_harness_result(const DbResultSet& result_set) {
    std::string schema;
    schema.reserve(result_set.column_types.size());
    for (const auto& type : result_set.column_types) {
        schema += to_type_tag(type);
    }

    std::vector<std::string> values;
    values.reserve(result_set.rows.size() * schema.size());
    for (const auto& row : result_set.rows) {
        for (size_t col = 0; col < row.size(); ++col) {
            const char tag = col < schema.size() ? schema[col] : kTextTag;
            values.push_back(render_value(row[col], tag));
        }
    }

    return HarnessResult::rows(std::move(schema), std::move(values));
}

} // namespace logictest
