#include "runner/condition_evaluator.hpp"

#include <algorithm>

namespace logictest {

bool should_execute_for_engine(const std::vector<Condition>& conditions, const std::string& engine) {
    if (conditions.size() == 1 && conditions[0].is_only) {
        return conditions[0].engine == engine;
    }

    return std::none_of(conditions.begin(), conditions.end(),
        [&engine](const Condition& c) { return c.is_skip && c.engine == engine; });
}

} // namespace logictest
