#pragma once

#include <iosfwd>
#include <string>

#include <cellsim/cable_params.hpp>
#include <cellsim/csimexcept.hpp>

#include <nlohmann/json.hpp>

#define CELLSIM_JSONIO_VERSION 1

namespace cellsimio {

struct jsonio_error: public csim::csim_exception {
    jsonio_error(const std::string& msg);
};

// Input in JSON not used
struct jsonio_unused_input: jsonio_error {
    explicit jsonio_unused_input(const std::string& key);
    std::string key;
};

// Value of the wrong type, or not one of the accepted names
struct jsonio_bad_value: jsonio_error {
    jsonio_bad_value(const std::string& key, const std::string& err);
    std::string key;
};

struct jsonio_version_error: jsonio_error {
    explicit jsonio_version_error(unsigned version);
    unsigned version;
};

// Load/store circuit parameters from/to JSON.
//
// Every field is optional; absent fields keep their defaults. Unknown keys
// are rejected with jsonio_unused_input. Values are not range checked here:
// that happens when the parameters are used.
csim::circuit_parameters load_circuit_parameters(const nlohmann::json&);
csim::circuit_parameters load_circuit_parameters(std::istream&);
nlohmann::json write_json(const csim::circuit_parameters&);

} // namespace cellsimio

namespace csim {

void to_json(nlohmann::json&, const membrane_parameters&);
void from_json(const nlohmann::json&, membrane_parameters&);
void to_json(nlohmann::json&, const hh_parameters&);
void from_json(const nlohmann::json&, hh_parameters&);
void to_json(nlohmann::json&, const dlambda_policy&);
void from_json(const nlohmann::json&, dlambda_policy&);
void to_json(nlohmann::json&, const simulation_parameters&);
void from_json(const nlohmann::json&, simulation_parameters&);
void to_json(nlohmann::json&, const circuit_parameters&);
void from_json(const nlohmann::json&, circuit_parameters&);

} // namespace csim
