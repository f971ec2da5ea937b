#include "db/mysql/mysql_type_map.hpp"

namespace logictest {

GenericColumnType MysqlTypeMap::field_type_to_generic(enum_field_types field_type) {
    switch (field_type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
            return GenericColumnType::SMALLINT;
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_YEAR:
            return GenericColumnType::INTEGER;
        case MYSQL_TYPE_LONGLONG:
            return GenericColumnType::BIGINT;
        case MYSQL_TYPE_FLOAT:
            return GenericColumnType::REAL;
        case MYSQL_TYPE_DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return GenericColumnType::NUMERIC;
        case MYSQL_TYPE_STRING:
            return GenericColumnType::CHAR;
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
        case MYSQL_TYPE_ENUM:
        case MYSQL_TYPE_SET:
            return GenericColumnType::VARCHAR;
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
            return GenericColumnType::BLOB;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
            return GenericColumnType::DATE;
        case MYSQL_TYPE_TIME:
            return GenericColumnType::TIME;
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_TIMESTAMP:
            return GenericColumnType::TIMESTAMP;
        case MYSQL_TYPE_JSON:
            return GenericColumnType::JSON;
        case MYSQL_TYPE_BIT:
        case MYSQL_TYPE_GEOMETRY:
            return GenericColumnType::VENDOR_SPECIFIC;
        default:
            return GenericColumnType::UNKNOWN;
    }
}

GenericColumnType MysqlTypeMap::field_column_type(enum_field_types field_type, unsigned int flags) {
    GenericColumnType generic = field_type_to_generic(field_type);
    // TEXT columns arrive as BLOB types without the binary flag
    if (generic == GenericColumnType::BLOB && !(flags & BINARY_FLAG)) {
        generic = GenericColumnType::TEXT;
    }
    return generic;
}

} // namespace logictest
