#include <cstddef>
#include <iostream>
#include <map>
#include <string>
#include <utility>

#include <cellsim/cable_params.hpp>
#include <cellsim/morph/primitives.hpp>

#include <cellsimio/jsonio.hpp>

#include "json_helpers.hpp"

namespace cellsimio {

jsonio_error::jsonio_error(const std::string& msg):
    csim_exception(msg)
{}

jsonio_unused_input::jsonio_unused_input(const std::string& key):
    jsonio_error("Unused input parameter: \""+key+"\""),
    key(key)
{}

jsonio_bad_value::jsonio_bad_value(const std::string& key, const std::string& err):
    jsonio_error("Bad value for parameter \""+key+"\": "+err),
    key(key)
{}

jsonio_version_error::jsonio_version_error(unsigned version):
    jsonio_error("Unsupported parameter file version "+std::to_string(version)),
    version(version)
{}

} // namespace cellsimio

namespace {

// Map between enumerations and the names used in parameter files.

template <typename E>
struct named {
    const char* name;
    E value;
};

constexpr named<csim::membrane_mechanism> mechanism_names[] = {
    {"passive", csim::membrane_mechanism::passive},
    {"hh",      csim::membrane_mechanism::hh},
};

constexpr named<csim::count_rounding> rounding_names[] = {
    {"ceil", csim::count_rounding::ceil},
    {"odd",  csim::count_rounding::odd},
};

constexpr named<csim::gating_scheme> gating_names[] = {
    {"backward-euler", csim::gating_scheme::backward_euler},
    {"cnexp",          csim::gating_scheme::cnexp},
};

constexpr named<csim::voltage_scheme> voltage_names[] = {
    {"backward-euler", csim::voltage_scheme::backward_euler},
    {"explicit-euler", csim::voltage_scheme::explicit_euler},
};

template <typename E, std::size_t N>
std::string name_of(const named<E> (&table)[N], E value) {
    for (auto& e: table) {
        if (e.value==value) return e.name;
    }
    return {};
}

template <typename E, std::size_t N>
E value_of(const named<E> (&table)[N], const std::string& key, const std::string& name) {
    for (auto& e: table) {
        if (name==e.name) return e.value;
    }
    throw cellsimio::jsonio_bad_value(key, "unknown name \""+name+"\"");
}

template <typename E, std::size_t N>
void find_and_remove_enum(const char* key, nlohmann::json& j, const named<E> (&table)[N], E& value) {
    if (auto name = cellsimio::find_and_remove_json<std::string>(key, j)) {
        value = value_of(table, key, name.value());
    }
}

template <typename T>
void find_and_remove(const char* key, nlohmann::json& j, T& value) {
    if (auto v = cellsimio::find_and_remove_json<T>(key, j)) {
        value = v.value();
    }
}

csim::sample_kind kind_of(const std::string& name) {
    for (int tag = 0; tag<=7; ++tag) {
        auto k = static_cast<csim::sample_kind>(tag);
        if (name==to_string(k)) return k;
    }
    throw cellsimio::jsonio_bad_value("mechanisms-by-kind", "unknown kind \""+name+"\"");
}

} // anonymous namespace

namespace csim {

void to_json(nlohmann::json& j, const membrane_parameters& p) {
    j["axial-resistivity"] = p.axial_resistivity;
    j["membrane-capacitance"] = p.membrane_capacitance;
    j["init-membrane-potential"] = p.init_membrane_potential;
}

void from_json(const nlohmann::json& j, membrane_parameters& p) {
    auto j_copy = j;
    find_and_remove("axial-resistivity", j_copy, p.axial_resistivity);
    find_and_remove("membrane-capacitance", j_copy, p.membrane_capacitance);
    find_and_remove("init-membrane-potential", j_copy, p.init_membrane_potential);
    cellsimio::throw_if_not_empty(j_copy);
}

void to_json(nlohmann::json& j, const hh_parameters& p) {
    j["gnabar"] = p.gnabar;
    j["gkbar"] = p.gkbar;
    j["gl"] = p.gl;
    j["ena"] = p.ena;
    j["ek"] = p.ek;
    j["el"] = p.el;
    j["temperature"] = p.temperature;
}

void from_json(const nlohmann::json& j, hh_parameters& p) {
    auto j_copy = j;
    find_and_remove("gnabar", j_copy, p.gnabar);
    find_and_remove("gkbar", j_copy, p.gkbar);
    find_and_remove("gl", j_copy, p.gl);
    find_and_remove("ena", j_copy, p.ena);
    find_and_remove("ek", j_copy, p.ek);
    find_and_remove("el", j_copy, p.el);
    find_and_remove("temperature", j_copy, p.temperature);
    cellsimio::throw_if_not_empty(j_copy);
}

void to_json(nlohmann::json& j, const dlambda_policy& p) {
    j["frequency"] = p.frequency;
    j["d-lambda"] = p.d_lambda;
    j["rounding"] = name_of(rounding_names, p.rounding);
}

void from_json(const nlohmann::json& j, dlambda_policy& p) {
    auto j_copy = j;
    find_and_remove("frequency", j_copy, p.frequency);
    find_and_remove("d-lambda", j_copy, p.d_lambda);
    find_and_remove_enum("rounding", j_copy, rounding_names, p.rounding);
    cellsimio::throw_if_not_empty(j_copy);
}

void to_json(nlohmann::json& j, const simulation_parameters& p) {
    j["dt"] = p.dt;
    j["t-end"] = p.t_end;
    j["max-dt"] = p.max_dt;
    j["gating"] = name_of(gating_names, p.gating);
    j["voltage"] = name_of(voltage_names, p.voltage);
    j["sample-interval"] = p.sample_interval;
    j["record-gating"] = p.record_gating;
}

void from_json(const nlohmann::json& j, simulation_parameters& p) {
    auto j_copy = j;
    find_and_remove("dt", j_copy, p.dt);
    find_and_remove("t-end", j_copy, p.t_end);
    find_and_remove("max-dt", j_copy, p.max_dt);
    find_and_remove_enum("gating", j_copy, gating_names, p.gating);
    find_and_remove_enum("voltage", j_copy, voltage_names, p.voltage);
    find_and_remove("sample-interval", j_copy, p.sample_interval);
    find_and_remove("record-gating", j_copy, p.record_gating);
    cellsimio::throw_if_not_empty(j_copy);
}

void to_json(nlohmann::json& j, const circuit_parameters& p) {
    j["version"] = CELLSIM_JSONIO_VERSION;
    j["membrane"] = p.membrane;
    j["channels"] = p.channels;
    j["mechanism"] = name_of(mechanism_names, p.default_mechanism);
    for (auto& [kind, mech]: p.mechanism_by_kind) {
        j["mechanisms-by-kind"][to_string(kind)] = name_of(mechanism_names, mech);
    }
    j["discretization"] = p.discretization;
    j["simulation"] = p.simulation;
}

void from_json(const nlohmann::json& j, circuit_parameters& p) {
    auto j_copy = j;
    if (auto version = cellsimio::find_and_remove_json<unsigned>("version", j_copy)) {
        if (version.value()!=CELLSIM_JSONIO_VERSION) {
            throw cellsimio::jsonio_version_error(version.value());
        }
    }
    find_and_remove("membrane", j_copy, p.membrane);
    find_and_remove("channels", j_copy, p.channels);
    find_and_remove_enum("mechanism", j_copy, mechanism_names, p.default_mechanism);
    if (auto by_kind = cellsimio::find_and_remove_json<std::map<std::string, std::string>>("mechanisms-by-kind", j_copy)) {
        for (auto& [kind, mech]: by_kind.value()) {
            p.mechanism_by_kind[kind_of(kind)] = value_of(mechanism_names, "mechanisms-by-kind", mech);
        }
    }
    find_and_remove("discretization", j_copy, p.discretization);
    find_and_remove("simulation", j_copy, p.simulation);
    cellsimio::throw_if_not_empty(j_copy);
}

} // namespace csim

namespace cellsimio {

csim::circuit_parameters load_circuit_parameters(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw jsonio_error("Circuit parameters must be a JSON object");
    }
    csim::circuit_parameters p;
    from_json(j, p);
    return p;
}

csim::circuit_parameters load_circuit_parameters(std::istream& in) {
    nlohmann::json j;
    try {
        in >> j;
    }
    catch (nlohmann::json::parse_error& e) {
        throw jsonio_error(e.what());
    }
    return load_circuit_parameters(j);
}

nlohmann::json write_json(const csim::circuit_parameters& p) {
    nlohmann::json j = p;
    return j;
}

} // namespace cellsimio
