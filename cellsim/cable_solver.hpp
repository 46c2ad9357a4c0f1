#pragma once

#include <cstddef>
#include <vector>

#include <cellsim/csimexcept.hpp>

namespace csim {

// Backward Euler step of the cable equation on a tree, by Hines elimination.
//
// The matrix is symmetric with the sparsity of the tree: off-diagonal
// entries couple each compartment to its parent, and compartments are
// ordered so that p[i] < i.

struct cable_solver {
    using value_type = double;
    using index_type = int;
    using array      = std::vector<value_type>;
    using iarray     = std::vector<index_type>;

    iarray parent_index;

    array d;              // [μS]
    array u;              // [μS]
    array cv_capacitance; // [pF]
    array invariant_d;    // [μS] invariant part of matrix diagonal

    cable_solver() = default;

    // p:    parent index, -1 for the root
    // cap:  compartment capacitance [pF]
    // cond: conductance between each compartment and its parent [μS]
    cable_solver(const iarray& p, const array& cap, const array& cond):
        parent_index(p),
        d(size(), 0), u(size(), 0),
        cv_capacitance(cap),
        invariant_d(size(), 0)
    {
        if (cap.size()!=size() || cond.size()!=size()) {
            throw csim_internal_error("cable_solver: inconsistent compartment counts");
        }

        // Build invariant parts
        for (std::size_t i = 1; i<size(); ++i) {
            const auto gij = cond[i];
            u[i] = -gij;
            invariant_d[i] += gij;
            if (p[i]!=-1) {
                invariant_d[p[i]] += gij;
            }
        }
    }

    // Setup and solve the cable equation
    // * expects the voltage from its first argument
    // * will likewise overwrite the first argument with the solution
    //
    //   dt           [ms]
    //   voltage      [mV]
    //   current      [nA]  net outward current per compartment
    //   conductance  [μS]  membrane conductance per compartment
    void solve(array& rhs, value_type dt, const array& current, const array& conductance) {
        const value_type oodt = 1e-3/dt;             // [1/µs]
        for (std::size_t i = 0; i<size(); ++i) {
            const auto gi = oodt*cv_capacitance[i] + conductance[i]; // [μS]
            d[i] = gi + invariant_d[i];                              // [μS]
            rhs[i] = gi*rhs[i] - current[i];                         // [nA]
        }
        solve(rhs);
    }

    // Solve with the assembled diagonal.
    // Afterwards rhs will contain the solution.
    void solve(array& rhs) {
        const int n = size();
        if (n==0 || d[0]==0) return;

        // backward sweep
        for (int i = n-1; i>0; --i) {
            const auto factor = u[i]/d[i];
            const auto pi = parent_index[i];
            d[pi] -= factor*u[i];
            rhs[pi] -= factor*rhs[i];
        }
        // solve root
        rhs[0] /= d[0];
        // forward sweep
        for (int i = 1; i<n; ++i) {
            rhs[i] -= u[i]*rhs[parent_index[i]];
            rhs[i] /= d[i];
        }
    }

    std::size_t size() const { return parent_index.size(); }
};

} // namespace csim
