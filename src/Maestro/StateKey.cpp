// =================================================================
// src/Maestro/StateKey.cpp
// =================================================================
// Implementation of the state key encoding.

#include "Maestro/StateKey.hpp"
#include <algorithm>
#include <vector>

namespace Maestro {

namespace {

std::string encodeValue(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::string:
            return value.get<std::string>();
        case nlohmann::json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return value.dump();
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
            return "len:" + std::to_string(value.size());
        default:
            return value.type_name();
    }
}

} // anonymous namespace

std::string stateToKey(const nlohmann::json& state) {
    if (!state.is_object()) {
        return encodeValue(state);
    }

    std::vector<std::string> keys;
    for (auto it = state.begin(); it != state.end(); ++it) {
        keys.push_back(it.key());
    }
    std::sort(keys.begin(), keys.end());

    std::string key;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) {
            key += "|";
        }
        key += keys[i] + "=" + encodeValue(state.at(keys[i]));
    }
    return key;
}

} // namespace Maestro
