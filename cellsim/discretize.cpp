#include <cmath>
#include <utility>
#include <vector>

#include <cellsim/csimexcept.hpp>
#include <cellsim/discretize.hpp>
#include <cellsim/math.hpp>

namespace csim {

double length_constant(double diameter, double Ra, double Cm, double frequency) {
    if (!(diameter>0) || !(Ra>0) || !(Cm>0) || !(frequency>0)) return 0;
    double lambda = 1e5*std::sqrt(diameter/(4*math::pi<double>*frequency*Ra*Cm));
    return std::isfinite(lambda)? lambda: 0;
}

msize_t dlambda_count(double length, double lambda, const dlambda_policy& policy) {
    if (!(length>0)) return 1;

    double x = length/(policy.d_lambda*lambda);
    double n = 1;
    switch (policy.rounding) {
    case count_rounding::ceil:
        n = std::ceil(x);
        break;
    case count_rounding::odd:
        n = std::floor((x+0.9)/2)*2+1;
        break;
    }
    if (!(n<=max_chain_size)) {
        throw compartment_count_error(length, lambda, n);
    }
    return n<1? 1: msize_t(n);
}

void set_cable_properties(compartment_node& node, const membrane_parameters& mp) {
    const double r = node.diameter/2;
    node.area = math::area_cylinder(node.length, node.diameter);             // [µm²]
    // µF/cm²·µm² = 1e-2 pF
    node.capacitance = 1e-2*mp.membrane_capacitance*node.area;              // [pF]
    // Ω·cm·µm/µm² = 1e-2 MΩ
    node.axial_resistance = 1e-2*mp.axial_resistivity*node.length/math::area_circle(r); // [MΩ]
}

compartment_tree discretize(const compartment_tree& geometry,
                            const membrane_parameters& mp,
                            const dlambda_policy& policy)
{
    check_membrane_parameters(mp);
    check_dlambda_policy(policy);

    const double Ra = mp.axial_resistivity;
    const double Cm = mp.membrane_capacitance;

    compartment_tree result;
    result.reserve(geometry.size());

    // Handle of the distal compartment that represents each geometric node;
    // children of the node attach to it.
    std::vector<msize_t> distal(geometry.size(), mnpos);

    for (msize_t i = 0; i<geometry.size(); ++i) {
        const auto& seg = geometry[i];
        const double d = 2*seg.dist.radius;
        const double lambda = length_constant(d, Ra, Cm, policy.frequency);
        if (lambda<=0) {
            throw invalid_geometry_error(seg.source_id, d);
        }

        compartment_node base;
        base.source_id = seg.source_id;
        base.tag = seg.tag;
        base.kind = seg.kind;
        base.diameter = d;
        base.lambda = lambda;

        if (seg.is_root()) {
            base.prox = seg.prox;
            base.dist = seg.dist;
            base.length = d;
            set_cable_properties(base, mp);
            distal[i] = result.append(mnpos, std::move(base));
            continue;
        }

        const msize_t parent = distal[seg.parent];
        if (is_collocated(seg.prox, seg.dist)) {
            distal[i] = parent;
            continue;
        }
        const double L = distance(seg.prox, seg.dist);

        const msize_t n = dlambda_count(L, lambda, policy);
        msize_t p = parent;
        for (msize_t k = 0; k<n; ++k) {
            compartment_node c = base;
            c.prox = lerp(seg.prox, seg.dist, double(k)/n);
            c.dist = lerp(seg.prox, seg.dist, double(k+1)/n);
            c.prox.radius = c.dist.radius = seg.dist.radius;
            c.chain_index = k;
            c.chain_size = n;
            c.length = L/n;
            set_cable_properties(c, mp);
            p = result.append(p, std::move(c));
        }
        distal[i] = p;
    }

    return result;
}

} // namespace csim
