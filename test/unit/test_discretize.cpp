#include <cmath>
#include <utility>
#include <vector>

#include <cellsim/cable_params.hpp>
#include <cellsim/csimexcept.hpp>
#include <cellsim/discretize.hpp>
#include <cellsim/math.hpp>
#include <cellsim/morph/topology.hpp>

#include <gtest/gtest.h>

#include "common_morphologies.hpp"

using namespace csim;
using common_morphology::morph_record;

namespace {

compartment_tree geometry(const std::vector<morph_record>& recs) {
    auto topo = build_topology(recs);
    return std::move(topo.trees.at(0));
}

// Straight segment from a soma of radius 5 µm, along x.
compartment_tree cable(double length, double radius) {
    return geometry({
        {1, 1, 0, 0, 0, 5, -1},
        {2, 3, length, 0, 0, radius, 1},
    });
}

} // anonymous namespace

TEST(discretize, length_constant) {
    // λ = 1e5·√(d/(4π·f·Ra·Cm))
    const double pi = math::pi<double>;
    EXPECT_DOUBLE_EQ(1e5*std::sqrt(1/(4*pi*100*35.4)), length_constant(1, 35.4, 1, 100));
    EXPECT_NEAR(474.13, length_constant(1, 35.4, 1, 100), 0.01);

    // λ ∝ √d
    EXPECT_DOUBLE_EQ(2*length_constant(1, 35.4, 1, 100), length_constant(4, 35.4, 1, 100));

    EXPECT_EQ(0., length_constant(0, 35.4, 1, 100));
    EXPECT_EQ(0., length_constant(-1, 35.4, 1, 100));
    EXPECT_EQ(0., length_constant(1, 0, 1, 100));
    EXPECT_EQ(0., length_constant(1, 35.4, 0, 100));
    EXPECT_EQ(0., length_constant(1, 35.4, 1, 0));
}

TEST(discretize, dlambda_count) {
    dlambda_policy ceil_policy;
    dlambda_policy odd_policy;
    odd_policy.rounding = count_rounding::odd;

    // L/(0.1·λ) = 3.5
    EXPECT_EQ(4u, dlambda_count(35, 100, ceil_policy));
    EXPECT_EQ(5u, dlambda_count(35, 100, odd_policy));

    // L/(0.1·λ) = 2.05
    EXPECT_EQ(3u, dlambda_count(20.5, 100, ceil_policy));
    EXPECT_EQ(3u, dlambda_count(20.5, 100, odd_policy));


    // At least one compartment.
    EXPECT_EQ(1u, dlambda_count(0.01, 100, ceil_policy));
    EXPECT_EQ(1u, dlambda_count(0.01, 100, odd_policy));
    EXPECT_EQ(1u, dlambda_count(0, 100, ceil_policy));

    dlambda_policy coarse;
    coarse.d_lambda = 0.5;
    EXPECT_EQ(1u, dlambda_count(35, 100, coarse));

    // Exact multiples are not rounded up.
    EXPECT_EQ(2u, dlambda_count(100, 100, coarse));

    // Counts beyond the chain limit are rejected, not truncated.
    EXPECT_EQ(max_chain_size, dlambda_count(100.*max_chain_size, 1000, ceil_policy));
    EXPECT_THROW(dlambda_count(100.*max_chain_size+1, 1000, ceil_policy), compartment_count_error);
    EXPECT_THROW(dlambda_count(1e13, length_constant(1e-6, 35.4, 1, 100), ceil_policy), compartment_count_error);
    EXPECT_THROW(dlambda_count(1e13, length_constant(1e-6, 35.4, 1, 100), odd_policy), compartment_count_error);

    try {
        dlambda_count(1e13, 0.5, ceil_policy);
        FAIL() << "expected compartment_count_error";
    }
    catch (compartment_count_error& e) {
        EXPECT_EQ(1e13, e.length);
        EXPECT_EQ(0.5, e.lambda);
        EXPECT_NEAR(2e14, e.count, 2);
    }
}

TEST(discretize, too_many_compartments) {
    auto g = cable(1e13, 0.5e-6);
    membrane_parameters mp;
    EXPECT_THROW(discretize(g, mp, dlambda_policy{}), compartment_count_error);
}

TEST(discretize, ball_and_stick) {
    auto g = geometry(common_morphology::ball_and_stick());
    ASSERT_EQ(2u, g.size());

    membrane_parameters mp;
    mp.axial_resistivity = 35.4;
    mp.membrane_capacitance = 1.0;
    dlambda_policy policy;
    policy.frequency = 100;

    auto t = discretize(g, mp, policy);

    // λ of the dendrite is positive and finite; its 10 µm fit in one
    // compartment.
    ASSERT_EQ(2u, t.size());
    EXPECT_GT(t[1].lambda, 0.);
    EXPECT_TRUE(std::isfinite(t[1].lambda));
    EXPECT_NEAR(948.3, t[1].lambda, 0.1);
    EXPECT_EQ(1u, t[1].chain_size);
    EXPECT_DOUBLE_EQ(10., t[1].length);
    EXPECT_DOUBLE_EQ(4., t[1].diameter);
    EXPECT_EQ(0u, t[1].parent);
}

TEST(discretize, soma_cylinder) {
    auto t = discretize(geometry(common_morphology::soma_only(5)), {}, {});
    ASSERT_EQ(1u, t.size());

    const auto& s = t[0];
    EXPECT_TRUE(s.is_root());
    EXPECT_EQ(10., s.length);
    EXPECT_EQ(10., s.diameter);
    // Lateral area of the cylinder equals the area of the sphere.
    EXPECT_DOUBLE_EQ(4*math::pi<double>*25, s.area);
    EXPECT_DOUBLE_EQ(1e-2*s.area, s.capacitance);
}

TEST(discretize, dlambda_rule) {
    membrane_parameters mp;
    dlambda_policy policy;

    const double L = 150, r = 0.5;
    auto t = discretize(cable(L, r), mp, policy);

    const double lambda = length_constant(2*r, mp.axial_resistivity, mp.membrane_capacitance, policy.frequency);
    const unsigned n = std::ceil(L/(0.1*lambda));
    EXPECT_EQ(4u, n);
    ASSERT_EQ(1+n, t.size());

    // A linear chain from the soma, with the lengths summing to L.
    double total = 0;
    for (msize_t i = 1; i<t.size(); ++i) {
        const auto& c = t[i];
        EXPECT_EQ(i-1, c.parent);
        EXPECT_EQ(i-1, c.chain_index);
        EXPECT_EQ(n, c.chain_size);
        EXPECT_EQ(2, c.source_id);
        EXPECT_EQ(sample_kind::dendrite, c.kind);
        EXPECT_EQ(1., c.diameter);
        EXPECT_DOUBLE_EQ(lambda, c.lambda);
        EXPECT_DOUBLE_EQ(L/n/lambda, c.electrotonic_length());
        total += c.length;
    }
    EXPECT_NEAR(L, total, 1e-12*L);
    EXPECT_NEAR(L+10, t.total_length(), 1e-12*L);

    // Compartment end points subdivide the segment.
    EXPECT_EQ((mpoint{0, 0, 0, r}), t[1].prox);
    EXPECT_DOUBLE_EQ(L/4, t[1].dist.x);
    EXPECT_DOUBLE_EQ(L/4, t[2].prox.x);
    EXPECT_DOUBLE_EQ(L, t[4].dist.x);
    EXPECT_EQ(r, t[4].dist.radius);

    // Odd rounding: L/(0.1·λ) ≈ 3.16
    policy.rounding = count_rounding::odd;
    EXPECT_EQ(6u, discretize(cable(L, r), mp, policy).size());
}

TEST(discretize, cable_properties) {
    membrane_parameters mp;
    mp.axial_resistivity = 100;
    mp.membrane_capacitance = 2;

    auto t = discretize(cable(10, 1), mp, {});
    ASSERT_EQ(2u, t.size());

    const auto& c = t[1];
    const double pi = math::pi<double>;
    EXPECT_DOUBLE_EQ(pi*2*10, c.area);                    // µm²
    EXPECT_DOUBLE_EQ(2e-2*c.area, c.capacitance);          // pF
    EXPECT_DOUBLE_EQ(1e-2*100*10/(pi*1), c.axial_resistance); // MΩ
}

TEST(discretize, fork) {
    auto t = discretize(geometry(common_morphology::forked_cell()), {}, {});

    // Children of a forking segment attach to its distal compartment.
    msize_t fork = mnpos;
    std::vector<msize_t> branch_roots;
    for (msize_t i = 0; i<t.size(); ++i) {
        if (t[i].source_id==2 && t[i].chain_index+1==t[i].chain_size) fork = i;
    }
    ASSERT_NE(mnpos, fork);
    EXPECT_TRUE(t.is_fork(fork));
    for (auto c: t.children(fork)) {
        EXPECT_EQ(0u, t[c].chain_index);
        branch_roots.push_back(t[c].source_id);
    }
    EXPECT_EQ((std::vector<msize_t>{3, 4}), branch_roots);

    // The axon hangs off the soma.
    EXPECT_EQ(2u, t.children(0).size());

    auto p = t.parent_index();
    for (std::size_t i = 1; i<p.size(); ++i) {
        EXPECT_LT(p[i], int(i));
    }
}

TEST(discretize, zero_length_segment) {
    // Record 3 sits on record 2: it is merged, and record 4 attaches to
    // the compartment of record 2.
    auto g = geometry({
        {1, 1,  0, 0, 0, 5, -1},
        {2, 3, 10, 0, 0, 1,  1},
        {3, 3, 10, 0, 0, 1,  2},
        {4, 3, 20, 0, 0, 1,  3},
    });

    auto t = discretize(g, {}, {});
    ASSERT_EQ(3u, t.size());
    EXPECT_EQ(mnpos, t.find_source(3));
    EXPECT_EQ(2, t[1].source_id);
    EXPECT_EQ(4, t[2].source_id);
    EXPECT_EQ(1u, t[2].parent);
}

TEST(discretize, invalid_geometry) {
    auto g = geometry({
        {1, 1,  0, 0, 0, 5, -1},
        {2, 3, 10, 0, 0, 1,  1},
        {3, 3, 20, 0, 0, 0,  2},
    });

    try {
        discretize(g, {}, {});
        FAIL() << "expected invalid_geometry_error";
    }
    catch (invalid_geometry_error& e) {
        EXPECT_EQ(3, e.source_id);
        EXPECT_EQ(0., e.diameter);
    }

    // Repaired radii can be discretized.
    topology_options opts;
    opts.repair_radius = 1;
    auto topo = build_topology({
        {1, 1,  0, 0, 0, 5, -1},
        {2, 3, 10, 0, 0, 1,  1},
        {3, 3, 20, 0, 0, 0,  2},
    }, opts);
    EXPECT_NO_THROW(discretize(topo.trees[0], {}, {}));
}

TEST(discretize, bad_parameters) {
    auto g = geometry(common_morphology::ball_and_stick());

    membrane_parameters mp;
    mp.axial_resistivity = 0;
    EXPECT_THROW(discretize(g, mp, {}), bad_parameter);

    mp = {};
    mp.membrane_capacitance = -1;
    EXPECT_THROW(discretize(g, mp, {}), bad_parameter);

    dlambda_policy policy;
    policy.frequency = 0;
    EXPECT_THROW(discretize(g, {}, policy), bad_parameter);

    policy = {};
    policy.d_lambda = 0;
    try {
        discretize(g, {}, policy);
        FAIL() << "expected bad_parameter";
    }
    catch (bad_parameter& e) {
        EXPECT_EQ("d-lambda", e.name);
        EXPECT_EQ(0., e.value);
    }
}
