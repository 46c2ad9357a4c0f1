#include <sstream>
#include <string>
#include <vector>
#include <utility>

#include <cellsim/csimexcept.hpp>

#include "util/pprintf.hpp"

namespace csim {

using util::pprintf;

namespace {
std::string id_list(const std::vector<int>& ids) {
    std::ostringstream o;
    const char* sep = "";
    for (auto id: ids) {
        o << sep << id;
        sep = " ";
    }
    return o.str();
}
} // anonymous namespace

csim_exception::csim_exception(const std::string& what):
    std::runtime_error{what}
{}

csim_internal_error::csim_internal_error(const std::string& what):
    std::logic_error(what)
{}

bad_parameter::bad_parameter(const std::string& name, double value):
    csim_exception(pprintf("invalid value for parameter {}: {}", name, value)),
    name(name),
    value(value)
{}

file_not_found_error::file_not_found_error(const std::string &fn):
    csim_exception(pprintf("Could not find readable file at '{}'", fn)),
    filename{fn}
{}

duplicate_id_error::duplicate_id_error(int id):
    topology_error(pprintf("duplicate morphology record id {}", id)),
    id(id)
{}

dangling_parent_error::dangling_parent_error(int id, int parent_id):
    topology_error(pprintf("record {} refers to missing parent record {}", id, parent_id)),
    id(id),
    parent_id(parent_id)
{}

cycle_error::cycle_error(std::vector<int> ids):
    topology_error(pprintf("records unreachable from a root, parent relation is cyclic: {}", id_list(ids))),
    ids(std::move(ids))
{}

zero_radius_error::zero_radius_error(int id):
    topology_error(pprintf("zero or negative radius for record {} which is not an end point", id)),
    id(id)
{}

invalid_compartment_parent::invalid_compartment_parent(msize_t parent, msize_t tree_size):
    topology_error(pprintf("invalid compartment parent {} for a tree of size {}", parent==mnpos? -1: (long long)parent, tree_size)),
    parent(parent),
    tree_size(tree_size)
{}

invalid_geometry_error::invalid_geometry_error(int source_id, double diameter):
    csim_exception(pprintf("no positive length constant for segment ending at record {} with diameter {} μm", source_id, diameter)),
    source_id(source_id),
    diameter(diameter)
{}

compartment_count_error::compartment_count_error(double length, double lambda, double count):
    csim_exception(pprintf("segment of length {} μm with length constant {} μm needs {} compartments, more than the limit {}",
                           length, lambda, count, max_chain_size)),
    length(length),
    lambda(lambda),
    count(count)
{}

integration_instability_error::integration_instability_error(time_type dt, time_type bound):
    csim_exception(pprintf("time step {} ms exceeds the stability bound {} ms", dt, bound)),
    dt(dt),
    bound(bound)
{}

divergence_error::divergence_error(msize_t compartment, time_type time):
    csim_exception(pprintf("non-finite membrane voltage in compartment {} at time {} ms", compartment, time)),
    compartment(compartment),
    time(time)
{}

bad_simulation_state::bad_simulation_state(dynamics_state state):
    csim_exception(pprintf("circuit can not be advanced in state {}", state)),
    state(state)
{}

} // namespace csim
