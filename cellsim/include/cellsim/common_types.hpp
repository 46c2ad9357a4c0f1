#pragma once

/*
 * Common definitions for index and value types used across the
 * cellsim library.
 */

#include <cstddef>
#include <cstdint>
#include <iosfwd>

namespace csim {

// Simulation time [ms].

using time_type = double;

// For indexes into circuit-local compartment data.
//
// Compartment handles are zero-based and numbered contiguously in
// topological order: the handle of a parent is always less than the
// handles of its children.

using msize_t = std::uint32_t;
constexpr msize_t mnpos = msize_t(-1);

// Upper limit on the number of compartments a single segment is split into.
constexpr msize_t max_chain_size = 1u<<20;

// The state of the dynamics of a circuit.
//
//   unstarted -> running -> completed
//
// `running` is re-entrant across calls that advance the circuit; a circuit
// in which a numerical blow-up was detected is `halted`. There is no
// transition out of `completed` or `halted` other than a reset.

enum class dynamics_state {
    unstarted,
    running,
    completed,
    halted
};

std::ostream& operator<<(std::ostream&, dynamics_state);

} // namespace csim
