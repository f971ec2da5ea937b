#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace logictest {

namespace {

const std::unordered_map<uint32_t, GenericColumnType>& oid_table() {
    static const std::unordered_map<uint32_t, GenericColumnType> OID_TO_TYPE = {
        {21,   GenericColumnType::SMALLINT},
        {23,   GenericColumnType::INTEGER},
        {20,   GenericColumnType::BIGINT},
        {26,   GenericColumnType::INTEGER},
        {700,  GenericColumnType::REAL},
        {701,  GenericColumnType::DOUBLE_PRECISION},
        {1700, GenericColumnType::NUMERIC},
        {25,   GenericColumnType::TEXT},
        {1043, GenericColumnType::VARCHAR},
        {1042, GenericColumnType::CHAR},
        {18,   GenericColumnType::CHAR},
        {19,   GenericColumnType::VARCHAR},
        {16,   GenericColumnType::BOOLEAN},
        {1082, GenericColumnType::DATE},
        {1083, GenericColumnType::TIME},
        {1266, GenericColumnType::TIME},
        {1114, GenericColumnType::TIMESTAMP},
        {1184, GenericColumnType::TIMESTAMP},
        {17,   GenericColumnType::BLOB},
        {114,  GenericColumnType::JSON},
        {3802, GenericColumnType::JSON},
        {705,  GenericColumnType::TEXT},
    };
    return OID_TO_TYPE;
}

} // anonymous namespace

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t oid) {
    const auto& table = oid_table();
    const auto it = table.find(oid);
    return it != table.end() ? it->second : GenericColumnType::VENDOR_SPECIFIC;
}

} // namespace logictest
