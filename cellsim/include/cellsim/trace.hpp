#pragma once

#include <cstddef>
#include <vector>

#include <cellsim/common_types.hpp>

namespace csim {

// Recorded state of every compartment of a circuit.
//
// values are indexed [compartment][sample]; gating traces are empty
// unless gating was recorded.
struct simulation_trace {
    std::vector<time_type> time;
    std::vector<std::vector<double>> voltage;
    std::vector<std::vector<double>> m;
    std::vector<std::vector<double>> h;
    std::vector<std::vector<double>> n;

    std::size_t n_sample() const { return time.size(); }
    std::size_t width() const { return voltage.size(); }

    void clear() {
        time.clear();
        voltage.clear();
        m.clear();
        h.clear();
        n.clear();
    }
};

} // namespace csim
