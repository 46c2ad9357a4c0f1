#pragma once

#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include <cellsimio/jsonio.hpp>

namespace cellsimio {

// Search a json object for an entry with a given name.
// If found, return the value and remove from json object.
template <typename T>
std::optional<T> find_and_remove_json(const char* name, nlohmann::json& j) {
    auto it = j.find(name);
    if (it==j.end()) {
        return std::nullopt;
    }
    try {
        T value = it->get<T>();
        j.erase(name);
        return value;
    }
    catch (nlohmann::json::exception& e) {
        throw jsonio_bad_value(name, e.what());
    }
}

inline void throw_if_not_empty(const nlohmann::json& json) {
    if (!json.empty()) {
        throw jsonio_unused_input(json.begin().key());
    }
}

} // namespace cellsimio
