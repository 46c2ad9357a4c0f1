#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

#include <cellsim/csimexcept.hpp>
#include <cellsim/dynamics.hpp>
#include <cellsim/mechanism.hpp>

#include "cable_solver.hpp"

namespace csim {

cable_integrator::cable_integrator(const compartment_tree& tree, const circuit_parameters& params):
    params_(params),
    q10_(hh_q10(params.channels.temperature)),
    stability_bound_(params.simulation.max_dt),
    parent_index_(tree.parent_index())
{
    check_membrane_parameters(params_.membrane);
    check_simulation_parameters(params_.simulation);

    const msize_t n = tree.size();
    mechanism_.reserve(n);
    face_conductance_.assign(n, 0);

    std::vector<double> capacitance(n);
    for (msize_t i = 0; i<n; ++i) {
        const auto& c = tree[i];
        mechanism_.push_back(params_.mechanism_for(c.kind));
        capacitance[i] = c.capacitance;

        // Resistance between compartment centres.
        if (!c.is_root()) {
            const double r = 0.5*(c.axial_resistance + tree[c.parent].axial_resistance); // [MΩ]
            if (!(r>0)) {
                throw invalid_geometry_error(c.source_id, c.diameter);
            }
            face_conductance_[i] = 1/r; // [μS]
        }
    }

    // Forward Euler is stable for dt < 2C/G, where G bounds the total
    // conductance seen by a compartment (Gershgorin).
    if (params_.simulation.voltage==voltage_scheme::explicit_euler) {
        std::vector<double> G(n, 0);
        for (msize_t i = 0; i<n; ++i) {
            G[i] += 1e-2*tree[i].area*max_conductance(params_.channels, mechanism_[i]);
            if (parent_index_[i]!=-1) {
                G[i] += 2*face_conductance_[i];
                G[parent_index_[i]] += 2*face_conductance_[i];
            }
        }
        for (msize_t i = 0; i<n; ++i) {
            if (G[i]>0) {
                stability_bound_ = std::min(stability_bound_, 2e-3*capacitance[i]/G[i]);
            }
        }
    }

    solver_ = std::make_unique<cable_solver>(parent_index_, capacitance, face_conductance_);

    v_prev_.resize(n);
    current_.resize(n);
    conductance_.resize(n);
    v_next_.resize(n);
}

cable_integrator::~cable_integrator() = default;
cable_integrator::cable_integrator(cable_integrator&&) = default;
cable_integrator& cable_integrator::operator=(cable_integrator&&) = default;

void cable_integrator::initialize(compartment_tree& tree) const {
    const double v0 = params_.membrane.init_membrane_potential;
    const auto rates = hh_rate_constants(v0, q10_);

    for (msize_t i = 0; i<tree.size(); ++i) {
        auto& c = tree[i];
        c.voltage = v0;
        if (mechanism_[i]==membrane_mechanism::hh) {
            c.m = rates.m.inf();
            c.h = rates.h.inf();
            c.n = rates.n.inf();
        }
        else {
            c.m = c.h = c.n = 0;
        }
    }
}

void cable_integrator::advance(compartment_tree& tree, time_type t, time_type dt, const stimulus_function& stim) {
    const msize_t n = tree.size();
    const auto& ch = params_.channels;
    const auto& sim = params_.simulation;

    // Pre-step state and membrane currents.
    for (msize_t i = 0; i<n; ++i) {
        const auto& c = tree[i];
        v_prev_[i] = c.voltage;

        const auto mc = mechanism_[i]==membrane_mechanism::hh?
            hh_current(ch, c.voltage, c.m, c.h, c.n):
            passive_current(ch, c.voltage);

        // mA/cm²·µm² = 1e-2 nA, S/cm²·µm² = 1e-2 μS
        const double a = 1e-2*c.area;
        current_[i] = a*mc.i - (stim? stim(i, t): 0.);
        conductance_[i] = a*mc.g;
    }

    switch (sim.voltage) {
    case voltage_scheme::backward_euler:
        v_next_ = v_prev_;
        solver_->solve(v_next_, dt, current_, conductance_);
        break;
    case voltage_scheme::explicit_euler:
        for (msize_t i = 0; i<n; ++i) {
            double i_axial = 0; // [nA]
            if (parent_index_[i]!=-1) {
                i_axial += face_conductance_[i]*(v_prev_[parent_index_[i]] - v_prev_[i]);
            }
            for (auto k: tree.children(i)) {
                i_axial += face_conductance_[k]*(v_prev_[k] - v_prev_[i]);
            }
            // nA/pF = 1e3 mV/ms
            v_next_[i] = v_prev_[i] + 1e3*dt*(i_axial - current_[i])/tree[i].capacitance;
        }
        break;
    }

    for (msize_t i = 0; i<n; ++i) {
        tree[i].voltage = v_next_[i];
    }
    for (msize_t i = 0; i<n; ++i) {
        if (!std::isfinite(v_next_[i])) {
            throw divergence_error(i, t+dt);
        }
    }

    // Gates advance at the updated voltage.
    for (msize_t i = 0; i<n; ++i) {
        if (mechanism_[i]!=membrane_mechanism::hh) continue;

        auto& c = tree[i];
        const auto r = hh_rate_constants(c.voltage, q10_);
        c.m = advance_gate(c.m, r.m, dt, sim.gating);
        c.h = advance_gate(c.h, r.h, dt, sim.gating);
        c.n = advance_gate(c.n, r.n, dt, sim.gating);
    }
}

void cable_integrator::record(const compartment_tree& tree, time_type t, simulation_trace& trace, bool gating) {
    const msize_t n = tree.size();
    trace.time.push_back(t);
    trace.voltage.resize(n);
    if (gating) {
        trace.m.resize(n);
        trace.h.resize(n);
        trace.n.resize(n);
    }

    for (msize_t i = 0; i<n; ++i) {
        const auto& c = tree[i];
        trace.voltage[i].push_back(c.voltage);
        if (gating) {
            trace.m[i].push_back(c.m);
            trace.h[i].push_back(c.h);
            trace.n[i].push_back(c.n);
        }
    }
}

} // namespace csim
