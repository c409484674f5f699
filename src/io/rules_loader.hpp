/**
 * Rules overrides: apply a JSON "rules" object onto a RulesConfig.
 *
 * The object mirrors RulesConfig: one member per subsystem, each holding
 * field overrides, e.g.
 *   { "movement": { "road_standard_miles_per_day": 14 },
 *     "siege":    { "town_threshold": 8 } }
 * Unknown sections and keys are ignored; values of the wrong type leave
 * the default in place.
 */

#ifndef STRAT_IO_RULES_LOADER_HPP
#define STRAT_IO_RULES_LOADER_HPP

#include "core/rules_config.hpp"
#include "io/json_reader.hpp"
#include <string>

namespace strat {

void load_rules_overrides(const JsonValue& overrides, RulesConfig& rules);

/**
 * Read a standalone rules file and apply it.
 * @throws std::runtime_error if the file is missing or malformed
 */
void load_rules_file(const std::string& path, RulesConfig& rules);

} // namespace strat

#endif // STRAT_IO_RULES_LOADER_HPP
