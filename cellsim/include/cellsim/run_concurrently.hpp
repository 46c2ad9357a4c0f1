#pragma once

#include <exception>
#include <vector>

#include <cellsim/circuit.hpp>

namespace csim {

// Run every circuit to completion on a pool of n_threads threads, counting
// the calling thread. Circuits already completed are left alone.
//
// Returns one entry per circuit: null on success, or the exception that
// stopped that circuit. A failing circuit does not affect the others.
std::vector<std::exception_ptr> run_concurrently(std::vector<circuit>& circuits, unsigned n_threads);

// Number of threads to use by default: the hardware concurrency, at least 1.
unsigned default_thread_count();

} // namespace csim
