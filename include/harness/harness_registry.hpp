#pragma once

#include "harness/iharness.hpp"
#include "core/database_type.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace logictest {

/**
 * @brief Registry for engine harnesses
 *
 * main() registers the harnesses compiled into the binary; the runner
 * looks them up by the configured engine type.
 *
 * Usage:
 *   HarnessRegistry::instance().register_harness(
 *       DatabaseType::POSTGRESQL,
 *       [](const std::string& conn) { return std::make_unique<PgHarness>(conn); });
 *
 *   auto harness = HarnessRegistry::instance().create(DatabaseType::POSTGRESQL, conn);
 */
class HarnessRegistry {
public:
    using Factory = std::function<std::unique_ptr<IHarness>(const std::string& connection_string)>;

    static HarnessRegistry& instance() {
        static HarnessRegistry registry;
        return registry;
    }

    void register_harness(DatabaseType type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    [[nodiscard]] std::unique_ptr<IHarness> create(
        DatabaseType type, const std::string& connection_string) const {
        const auto it = factories_.find(type);
        if (it == factories_.end()) {
            throw std::runtime_error(
                std::string("No harness registered for database type: ") +
                std::string(database_type_to_string(type)));
        }
        return it->second(connection_string);
    }

    [[nodiscard]] bool has_harness(DatabaseType type) const {
        return factories_.count(type) > 0;
    }

private:
    HarnessRegistry() = default;

    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

} // namespace logictest
