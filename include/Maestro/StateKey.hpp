// =================================================================
// include/Maestro/StateKey.hpp
// =================================================================
// Deterministic state -> table key encoding shared by the learning engines.

#pragma once

#include "nlohmann/json.hpp"
#include <string>

namespace Maestro {

/**
 * @brief Encode a state snapshot as a stable key
 *
 * Object keys are sorted; strings, numbers and booleans are encoded by
 * value, arrays and objects by their length ("len:N"), anything else by
 * its type name. Fields are joined as "k=v|k2=v2".
 *
 * @param state State snapshot
 * @return Key usable in learning tables
 */
std::string stateToKey(const nlohmann::json& state);

} // namespace Maestro
