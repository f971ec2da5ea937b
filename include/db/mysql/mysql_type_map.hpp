#pragma once

#include "core/column_type.hpp"
#include <mysql/mysql.h>
#include <cstdint>

namespace logictest {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps MySQL field types to GenericColumnType.
 */
class MysqlTypeMap {
public:
    /**
     * @brief Map MySQL field type to GenericColumnType
     * @param field_type MySQL enum_field_types value
     * @return Generic column type
     */
    [[nodiscard]] static GenericColumnType field_type_to_generic(enum_field_types field_type);

    /**
     * @brief Column type of a result field
     * @param field_type MySQL enum_field_types value
     * @param flags MYSQL_FIELD::flags (BINARY_FLAG separates BLOB from TEXT)
     */
    [[nodiscard]] static GenericColumnType field_column_type(enum_field_types field_type, unsigned int flags);
};

} // namespace logictest
