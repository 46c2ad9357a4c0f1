#pragma once

#include <memory>
#include <vector>

#include <cellsim/cable_params.hpp>
#include <cellsim/common_types.hpp>
#include <cellsim/morph/compartment_tree.hpp>
#include <cellsim/stimulus.hpp>
#include <cellsim/trace.hpp>

namespace csim {

struct cable_solver;

// Integrates the membrane voltage and gating state of a discretized
// compartment tree under the cable equation.
//
// Each step reads every compartment's pre-step voltage and gating state,
// then writes the post-step state: no compartment sees a neighbour's
// updated value within a step.
//
// The integrator keeps no reference to the tree it was built for; the
// tree is passed to each call and must have the same structure.
class cable_integrator {
public:
    cable_integrator(const compartment_tree& tree, const circuit_parameters& params);
    ~cable_integrator();

    cable_integrator(cable_integrator&&);
    cable_integrator& operator=(cable_integrator&&);

    // Set voltage to the initial membrane potential, and gates to their
    // steady state at that potential.
    void initialize(compartment_tree& tree) const;

    // Largest admissible time step [ms]: the configured max_dt, further
    // bounded for explicit voltage integration.
    time_type stability_bound() const { return stability_bound_; }

    // Advance all compartments from t to t+dt.
    // Throws divergence_error if a voltage is not finite after the step.
    void advance(compartment_tree& tree, time_type t, time_type dt, const stimulus_function& stim);

    // Append the state of every compartment at time t to a trace.
    static void record(const compartment_tree& tree, time_type t, simulation_trace& trace, bool gating);

    // Conductance between each compartment and its parent [μS].
    const std::vector<double>& face_conductance() const { return face_conductance_; }

    membrane_mechanism mechanism(msize_t i) const { return mechanism_[i]; }

private:
    circuit_parameters params_;
    double q10_;
    time_type stability_bound_;

    std::vector<int> parent_index_;
    std::vector<membrane_mechanism> mechanism_;
    std::vector<double> face_conductance_;

    std::unique_ptr<cable_solver> solver_;

    // Per-step scratch.
    std::vector<double> v_prev_;
    std::vector<double> current_;      // [nA]
    std::vector<double> conductance_;  // [μS]
    std::vector<double> v_next_;
};

} // namespace csim
