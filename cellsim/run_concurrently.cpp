#include <exception>
#include <thread>
#include <vector>

#include <cellsim/circuit.hpp>
#include <cellsim/csimexcept.hpp>
#include <cellsim/run_concurrently.hpp>

#include "threading/threading.hpp"

namespace csim {

std::vector<std::exception_ptr> run_concurrently(std::vector<circuit>& circuits, unsigned n_threads) {
    if (n_threads==0) {
        throw bad_parameter("threads", n_threads);
    }

    const int n = circuits.size();
    std::vector<std::exception_ptr> errors(n);

    threading::task_system ts(n_threads);

    // Each task touches only its own circuit and error slot.
    threading::parallel_for::apply(0, n, &ts,
        [&](int i) {
            try {
                if (circuits[i].state()!=dynamics_state::completed) {
                    circuits[i].run();
                }
            }
            catch (...) {
                errors[i] = std::current_exception();
            }
        });

    return errors;
}

unsigned default_thread_count() {
    auto n = std::thread::hardware_concurrency();
    return n? n: 1;
}

} // namespace csim
