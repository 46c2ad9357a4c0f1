#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

#include <cellsim/circuit.hpp>
#include <cellsim/csimexcept.hpp>
#include <cellsim/discretize.hpp>

namespace csim {

circuit::circuit(compartment_tree morphology, circuit_parameters params):
    morphology_(std::move(morphology)),
    params_(std::move(params)),
    stimulus_(no_stimulus())
{}

void circuit::set_parameters(circuit_parameters params) {
    if (state_!=dynamics_state::unstarted) {
        throw bad_simulation_state(state_);
    }
    params_ = std::move(params);
    compartments_ = compartment_tree{};
    discretized_ = false;
    integrator_.reset();
}

void circuit::set_stimulus(stimulus_function stim) {
    stimulus_ = stim? std::move(stim): no_stimulus();
}

void circuit::discretize() {
    compartments_ = csim::discretize(morphology_, params_.membrane, params_.discretization);
    discretized_ = true;
    integrator_.reset();
}

cable_integrator& circuit::integrator() {
    if (!discretized_) discretize();
    if (!integrator_) integrator_.emplace(compartments_, params_);
    return *integrator_;
}

time_type circuit::stability_bound() {
    return integrator().stability_bound();
}

void circuit::start() {
    const auto& sim = params_.simulation;
    check_simulation_parameters(sim);

    auto& I = integrator();
    if (sim.dt>I.stability_bound()) {
        throw integration_instability_error(sim.dt, I.stability_bound());
    }

    I.initialize(compartments_);
    t_ = 0;
    n_step_ = 0;
    next_sample_ = 0;
    trace_.clear();
    sample();

    state_ = dynamics_state::running;
}

void circuit::sample() {
    const auto& sim = params_.simulation;

    // Samples at t = 0, every sample interval and at t_end.
    const time_type eps = 1e-9*sim.dt;
    if (sim.sample_interval==0 || t_+eps>=next_sample_ || t_+eps>=sim.t_end) {
        cable_integrator::record(compartments_, t_, trace_, sim.record_gating);
        while (sim.sample_interval>0 && next_sample_<=t_+eps) {
            next_sample_ += sim.sample_interval;
        }
    }
}

std::size_t circuit::step(std::size_t n) {
    if (state_==dynamics_state::completed || state_==dynamics_state::halted) {
        throw bad_simulation_state(state_);
    }
    if (state_==dynamics_state::unstarted) {
        start();
    }

    const auto& sim = params_.simulation;
    const time_type eps = 1e-9*sim.dt;

    std::size_t taken = 0;
    while (taken<n && t_+eps<sim.t_end) {
        // The clock is a multiple of dt, to avoid accumulating rounding error.
        const time_type t_next = std::min(sim.t_end, (n_step_+1)*sim.dt);
        try {
            integrator_->advance(compartments_, t_, t_next-t_, stimulus_);
        }
        catch (divergence_error&) {
            state_ = dynamics_state::halted;
            throw;
        }
        ++n_step_;
        ++taken;
        t_ = t_next;
        sample();
    }

    if (t_+eps>=sim.t_end) {
        state_ = dynamics_state::completed;
    }
    return taken;
}

std::size_t circuit::run() {
    std::size_t taken = 0;
    do {
        taken += step(1000);
    } while (state_==dynamics_state::running);
    return taken;
}

void circuit::reset() {
    state_ = dynamics_state::unstarted;
    t_ = 0;
    n_step_ = 0;
    next_sample_ = 0;
    trace_.clear();
    if (discretized_ && integrator_) {
        integrator_->initialize(compartments_);
    }
}

circuit_set build_circuits(const std::vector<morph_record>& records,
                           const circuit_parameters& params,
                           const topology_options& opts)
{
    auto topo = build_topology(records, opts);

    circuit_set result;
    result.circuits.reserve(topo.trees.size());
    for (auto& tree: topo.trees) {
        result.circuits.emplace_back(std::move(tree), params);
    }
    result.warnings = std::move(topo.warnings);
    result.kind_counts = std::move(topo.kind_counts);
    return result;
}

} // namespace csim
