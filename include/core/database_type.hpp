#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace logictest {

// Engine identifiers; these are also the names skipif/onlyif match against
namespace keys {
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
}

enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        default: return "unknown";
    }
}

/**
 * @brief Resolve an engine name or alias, case-insensitively
 * @return std::nullopt for unknown names
 */
[[nodiscard]] inline std::optional<DatabaseType> parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL}
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size() &&
            std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                })) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace logictest
