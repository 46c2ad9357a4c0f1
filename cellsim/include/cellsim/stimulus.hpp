#pragma once

#include <functional>
#include <vector>

#include <cellsim/common_types.hpp>

namespace csim {

// Injected current [nA] into a compartment at a time [ms]. Positive
// current depolarizes the membrane.
using stimulus_function = std::function<double (msize_t compartment, time_type t)>;

// No current anywhere.
stimulus_function no_stimulus();

// Current clamp: a constant amplitude [nA] into one compartment over
// [delay, delay+duration).
stimulus_function i_clamp(msize_t compartment, time_type delay, time_type duration, double amplitude);

// A current pattern sampled at fixed intervals dt [ms] from t = 0, held
// constant over each interval and zero after the last sample.
stimulus_function sampled_stimulus(msize_t compartment, time_type dt, std::vector<double> values);

// Sum of stimuli.
stimulus_function stimulus_sum(std::vector<stimulus_function> terms);

} // namespace csim
