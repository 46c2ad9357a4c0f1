#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <cellsim/common_types.hpp>

// cellsim-specific exception hierarchy.

namespace csim {

// Internal logic error (if these are thrown,
// there is a bug in the library.)

struct csim_internal_error: std::logic_error {
    csim_internal_error(const std::string&);
};

// Common base-class for cellsim run-time errors.

struct csim_exception: std::runtime_error {
    csim_exception(const std::string&);
};

// Parameter errors:

// A configuration value violates its domain constraints, eg Ra <= 0.
struct bad_parameter: csim_exception {
    bad_parameter(const std::string& name, double value);
    std::string name;
    double value;
};

struct file_not_found_error: csim_exception {
    file_not_found_error(const std::string& fn);
    std::string filename;
};

// Topology errors: the morphology records do not describe a forest.

struct topology_error: csim_exception {
    topology_error(const std::string& what): csim_exception(what) {}
};

// Two or more records share an id.
struct duplicate_id_error: topology_error {
    explicit duplicate_id_error(int id);
    int id;
};

// A record names a parent id with no corresponding record.
struct dangling_parent_error: topology_error {
    dangling_parent_error(int id, int parent_id);
    int id;
    int parent_id;
};

// Records that can not be reached from any root: their parent
// relation is circular.
struct cycle_error: topology_error {
    explicit cycle_error(std::vector<int> ids);
    std::vector<int> ids;
};

// Zero radius on a record that is not an end point, in strict mode.
struct zero_radius_error: topology_error {
    explicit zero_radius_error(int id);
    int id;
};

// Attempt to attach a compartment to a parent that is not yet in the tree.
struct invalid_compartment_parent: topology_error {
    invalid_compartment_parent(msize_t parent, msize_t tree_size);
    msize_t parent;
    msize_t tree_size;
};

// Discretization errors:

// A segment for which no positive length constant exists.
struct invalid_geometry_error: csim_exception {
    invalid_geometry_error(int source_id, double diameter);
    int source_id;
    double diameter;
};

// A segment needs more compartments than one chain may hold.
struct compartment_count_error: csim_exception {
    compartment_count_error(double length, double lambda, double count);
    double length;
    double lambda;
    double count;
};

// Simulation errors:

struct integration_instability_error: csim_exception {
    integration_instability_error(time_type dt, time_type bound);
    time_type dt;
    time_type bound;
};

struct divergence_error: csim_exception {
    divergence_error(msize_t compartment, time_type time);
    msize_t compartment;
    time_type time;
};

struct bad_simulation_state: csim_exception {
    explicit bad_simulation_state(dynamics_state state);
    dynamics_state state;
};

} // namespace csim
