#include <cmath>
#include <utility>
#include <vector>

#include <cellsim/csimexcept.hpp>
#include <cellsim/stimulus.hpp>

namespace csim {

stimulus_function no_stimulus() {
    return [](msize_t, time_type) { return 0.; };
}

stimulus_function i_clamp(msize_t compartment, time_type delay, time_type duration, double amplitude) {
    if (!(duration>=0)) throw bad_parameter("i-clamp duration", duration);

    return [=](msize_t i, time_type t) {
        return i==compartment && t>=delay && t<delay+duration? amplitude: 0.;
    };
}

stimulus_function sampled_stimulus(msize_t compartment, time_type dt, std::vector<double> values) {
    if (!(dt>0)) throw bad_parameter("stimulus dt", dt);

    return [=, values = std::move(values)](msize_t i, time_type t) {
        if (i!=compartment || t<0) return 0.;
        // Guard against rounding just below a sample boundary.
        auto k = std::size_t(std::floor(t/dt + 1e-9));
        return k<values.size()? values[k]: 0.;
    };
}

stimulus_function stimulus_sum(std::vector<stimulus_function> terms) {
    return [terms = std::move(terms)](msize_t i, time_type t) {
        double sum = 0;
        for (auto& f: terms) {
            if (f) sum += f(i, t);
        }
        return sum;
    };
}

} // namespace csim
