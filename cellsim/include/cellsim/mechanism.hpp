#pragma once

#include <cellsim/cable_params.hpp>

// Membrane mechanisms: Hodgkin-Huxley 1952 kinetics and passive leak.
//
// Rate constants [1/ms] use the squid axon expressions, shifted to a
// resting potential of -65 mV, and scaled by a Q10 of 3 from 6.3 °C.

namespace csim {

// Opening and closing rates of one gate [1/ms].
struct gate_rates {
    double alpha;
    double beta;

    double inf() const { return alpha/(alpha+beta); }
    double tau() const { return 1/(alpha+beta); }
};

struct hh_rates {
    gate_rates m;
    gate_rates h;
    gate_rates n;
};

double hh_q10(double celsius);

hh_rates hh_rate_constants(double v, double q10);

// Membrane current density [mA/cm²] and the chord conductance [S/cm²]
// that linearizes it about v.
struct membrane_current {
    double i = 0;
    double g = 0;
};

membrane_current hh_current(const hh_parameters& p, double v, double m, double h, double n);
membrane_current passive_current(const hh_parameters& p, double v);

// Maximum membrane conductance density [S/cm²] of a mechanism.
double max_conductance(const hh_parameters& p, membrane_mechanism mech);

// Advance a gate variable x over dt [ms] at fixed rates.
//
// backward_euler: (x' - x)/dt = α(1 - x') - βx'
// cnexp:          x' = x∞ + (x - x∞)·exp(-dt/τ)
double advance_gate(double x, const gate_rates& r, double dt, gating_scheme scheme);

} // namespace csim
