#include <cmath>

#include <cellsim/math.hpp>
#include <cellsim/mechanism.hpp>

namespace csim {

double hh_q10(double celsius) {
    return std::pow(3., (celsius-6.3)/10.);
}

hh_rates hh_rate_constants(double v, double q10) {
    using math::exprelr;

    hh_rates r;
    r.m.alpha = q10*exprelr(-(v+40.)/10.);
    r.m.beta  = q10*4.*std::exp(-(v+65.)/18.);

    r.h.alpha = q10*0.07*std::exp(-(v+65.)/20.);
    r.h.beta  = q10*1./(std::exp(-(v+35.)/10.)+1.);

    r.n.alpha = q10*0.1*exprelr(-(v+55.)/10.);
    r.n.beta  = q10*0.125*std::exp(-(v+65.)/80.);
    return r;
}

membrane_current hh_current(const hh_parameters& p, double v, double m, double h, double n) {
    const double gna = p.gnabar*m*m*m*h;
    const double gk = p.gkbar*n*n*n*n;

    membrane_current c;
    c.i = gna*(v-p.ena) + gk*(v-p.ek) + p.gl*(v-p.el);
    c.g = gna + gk + p.gl;
    return c;
}

membrane_current passive_current(const hh_parameters& p, double v) {
    return {p.gl*(v-p.el), p.gl};
}

double max_conductance(const hh_parameters& p, membrane_mechanism mech) {
    return mech==membrane_mechanism::hh? p.gnabar+p.gkbar+p.gl: p.gl;
}

double advance_gate(double x, const gate_rates& r, double dt, gating_scheme scheme) {
    switch (scheme) {
    case gating_scheme::cnexp: {
        const double xinf = r.inf();
        return xinf + (x-xinf)*std::exp(-dt/r.tau());
    }
    case gating_scheme::backward_euler:
        break;
    }
    return (x + dt*r.alpha)/(1 + dt*(r.alpha+r.beta));
}

} // namespace csim
