#pragma once

#include <map>

#include <cellsim/common_types.hpp>
#include <cellsim/morph/primitives.hpp>

// Parameters of a circuit: membrane and channel properties, the
// discretization policy and the integration settings.
//
// Units follow NEURON conventions:
//     lengths [µm], Ra [Ω·cm], Cm [µF/cm²], conductances [S/cm²],
//     potentials [mV], time [ms], frequency [Hz], injected current [nA].

namespace csim {

enum class membrane_mechanism {
    passive,         // leak conductance only
    hh               // Hodgkin-Huxley 1952 sodium, potassium and leak
};

struct membrane_parameters {
    double axial_resistivity = 35.4;       // Ra [Ω·cm]
    double membrane_capacitance = 1.0;     // Cm [µF/cm²]
    double init_membrane_potential = -65;  // [mV]
};

struct hh_parameters {
    double gnabar = 0.12;      // [S/cm²]
    double gkbar = 0.036;      // [S/cm²]
    double gl = 0.0003;        // [S/cm²]
    double ena = 50;           // [mV]
    double ek = -77;           // [mV]
    double el = -54.3;         // [mV]
    double temperature = 6.3;  // [°C]
};

// Rounding of the d-lambda compartment count.
//   ceil: n = ⌈L/(d_lambda·λ)⌉
//   odd:  the smallest odd count not less than L/(d_lambda·λ)-0.1, as NEURON does.
enum class count_rounding {
    ceil,
    odd
};

struct dlambda_policy {
    double frequency = 100;    // [Hz]
    double d_lambda = 0.1;     // compartment length as a fraction of λ
    count_rounding rounding = count_rounding::ceil;
};

enum class gating_scheme {
    backward_euler,
    cnexp
};

enum class voltage_scheme {
    backward_euler,
    explicit_euler
};

struct simulation_parameters {
    time_type dt = 0.025;          // [ms]
    time_type t_end = 10;          // [ms]
    time_type max_dt = 0.1;        // stability bound on dt [ms]
    gating_scheme gating = gating_scheme::backward_euler;
    voltage_scheme voltage = voltage_scheme::backward_euler;
    time_type sample_interval = 0; // [ms], 0 samples every step
    bool record_gating = false;
};

struct circuit_parameters {
    membrane_parameters membrane;
    hh_parameters channels;
    membrane_mechanism default_mechanism = membrane_mechanism::hh;
    std::map<sample_kind, membrane_mechanism> mechanism_by_kind;
    dlambda_policy discretization;
    simulation_parameters simulation;

    membrane_mechanism mechanism_for(sample_kind k) const {
        auto it = mechanism_by_kind.find(k);
        return it==mechanism_by_kind.end()? default_mechanism: it->second;
    }
};

// Throw bad_parameter for values outside their domain.
void check_membrane_parameters(const membrane_parameters&);
void check_dlambda_policy(const dlambda_policy&);
void check_simulation_parameters(const simulation_parameters&);

} // namespace csim
