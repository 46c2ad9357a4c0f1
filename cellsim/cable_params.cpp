#include <cmath>

#include <cellsim/cable_params.hpp>
#include <cellsim/csimexcept.hpp>

namespace csim {

namespace {
void check_positive(const char* name, double value) {
    if (!(value>0) || !std::isfinite(value)) throw bad_parameter(name, value);
}
} // anonymous namespace

void check_membrane_parameters(const membrane_parameters& p) {
    check_positive("axial-resistivity", p.axial_resistivity);
    check_positive("membrane-capacitance", p.membrane_capacitance);
    if (!std::isfinite(p.init_membrane_potential)) {
        throw bad_parameter("init-membrane-potential", p.init_membrane_potential);
    }
}

void check_dlambda_policy(const dlambda_policy& p) {
    check_positive("frequency", p.frequency);
    check_positive("d-lambda", p.d_lambda);
}

void check_simulation_parameters(const simulation_parameters& p) {
    check_positive("dt", p.dt);
    check_positive("max-dt", p.max_dt);
    if (!(p.t_end>=0) || !std::isfinite(p.t_end)) throw bad_parameter("t-end", p.t_end);
    if (!(p.sample_interval>=0)) throw bad_parameter("sample-interval", p.sample_interval);
}

} // namespace csim
