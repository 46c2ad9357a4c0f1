#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

#include <cellsim/cable_params.hpp>
#include <cellsim/common_types.hpp>
#include <cellsim/dynamics.hpp>
#include <cellsim/morph/compartment_tree.hpp>
#include <cellsim/morph/morph_record.hpp>
#include <cellsim/morph/topology.hpp>
#include <cellsim/stimulus.hpp>
#include <cellsim/trace.hpp>

namespace csim {

// One self-contained cell model: its geometry, discretization, parameters,
// stimulus, clock and recorded trace.
//
// A circuit shares no state with any other circuit, so distinct circuits
// may be stepped concurrently from different threads. A single circuit is
// not thread safe.
class circuit {
public:
    explicit circuit(compartment_tree morphology, circuit_parameters params = {});

    circuit(const circuit&) = delete;
    circuit& operator=(const circuit&) = delete;
    circuit(circuit&&) = default;
    circuit& operator=(circuit&&) = default;

    // The geometric tree, one compartment per source record.
    const compartment_tree& morphology() const { return morphology_; }

    // The discretized tree; empty until discretized.
    const compartment_tree& compartments() const { return compartments_; }

    const circuit_parameters& parameters() const { return params_; }

    // Replace the parameters. Only allowed before the simulation starts;
    // an existing discretization is discarded.
    void set_parameters(circuit_parameters params);

    void set_stimulus(stimulus_function stim);

    bool is_discretized() const { return discretized_; }

    // Discretize the geometry by the d-lambda rule. Called implicitly by the
    // first step. On failure the circuit is left undiscretized.
    void discretize();

    dynamics_state state() const { return state_; }
    time_type time() const { return t_; }

    // Largest time step the integrator accepts [ms]. Discretizes if required.
    time_type stability_bound();

    // Advance by up to n time steps, stopping early at t_end. The final
    // step is shortened to end exactly at t_end. Returns the number of
    // steps taken.
    //
    // Throws:
    //     integration_instability_error  if dt exceeds the stability bound,
    //                                    before any step is taken;
    //     divergence_error               if a voltage diverges, after which
    //                                    the circuit is halted;
    //     bad_simulation_state           if completed or halted.
    std::size_t step(std::size_t n = 1);

    // Step until completed. Returns the number of steps taken.
    std::size_t run();

    // Return to the unstarted state, discarding the trace. The
    // discretization and stimulus are kept.
    void reset();

    const simulation_trace& trace() const { return trace_; }

private:
    compartment_tree morphology_;
    compartment_tree compartments_;
    circuit_parameters params_;
    stimulus_function stimulus_;
    bool discretized_ = false;

    dynamics_state state_ = dynamics_state::unstarted;
    time_type t_ = 0;
    std::size_t n_step_ = 0;
    time_type next_sample_ = 0;

    std::optional<cable_integrator> integrator_;
    simulation_trace trace_;

    cable_integrator& integrator();
    void start();
    void sample();
};

// The circuits built from one set of morphology records, one per root in
// input order, with the warnings raised building them.
struct circuit_set {
    std::vector<circuit> circuits;
    std::vector<zero_radius_warning> warnings;
    std::map<sample_kind, std::size_t> kind_counts;
};

// Build one undiscretized circuit per tree in the records.
// Throws the structural errors of build_topology.
circuit_set build_circuits(const std::vector<morph_record>& records,
                           const circuit_parameters& params = {},
                           const topology_options& opts = {});

} // namespace csim
