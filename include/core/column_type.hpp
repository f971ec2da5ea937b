#pragma once

#include <cstdint>

namespace logictest {

/**
 * @brief Database-agnostic column type classification
 *
 * Maps from vendor-specific types (PG OIDs, MySQL field types) and is
 * reduced to a sqllogictest type tag by to_type_tag().
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    // Boolean
    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,

    // Binary
    BLOB,

    // JSON
    JSON,

    // Vendor-specific fallback
    VENDOR_SPECIFIC,
};

inline constexpr char kIntegerTag = 'I';
inline constexpr char kRealTag = 'R';
inline constexpr char kTextTag = 'T';

/**
 * @brief Type tag used in sqllogictest result schemas
 */
[[nodiscard]] inline char to_type_tag(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
            return kIntegerTag;
        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::NUMERIC:
            return kRealTag;
        default:
            return kTextTag;
    }
}

} // namespace logictest
