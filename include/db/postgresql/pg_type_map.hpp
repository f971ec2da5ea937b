#pragma once

#include "core/column_type.hpp"
#include <cstdint>

namespace logictest {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps result column OIDs (PQftype) to GenericColumnType.
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL OID to GenericColumnType
     * @param oid PostgreSQL type OID
     * @return Generic column type
     */
    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);
};

} // namespace logictest
