#pragma once

#include <iosfwd>
#include <map>
#include <optional>
#include <vector>

#include <cellsim/morph/compartment_tree.hpp>
#include <cellsim/morph/morph_record.hpp>

namespace csim {

// Non-fatal: a record with zero or negative radius.
struct zero_radius_warning {
    int id;
    sample_kind kind;
    double radius = 0;

    bool operator==(const zero_radius_warning&) const = default;
    friend std::ostream& operator<<(std::ostream&, const zero_radius_warning&);
};

struct topology_options {
    // Collect zero radius warnings. Negative radii are flagged as zero radii.
    bool emit_warnings = true;

    // Zero radius on a record that is not an end point is an error.
    bool strict = false;

    // If set, zero and negative radii are replaced by this value [µm] after
    // warning.
    std::optional<double> repair_radius;
};

// Number of records of each kind.
std::map<sample_kind, std::size_t> kind_counts(const std::vector<morph_record>& records);

// Trees built from a set of morphology records: one per root record, in
// the order the roots appear in the input.
struct topology {
    std::vector<compartment_tree> trees;
    std::vector<zero_radius_warning> warnings;
    std::map<sample_kind, std::size_t> kind_counts;
};

// Validate the records and build one compartment tree per root.
//
// Throws:
//     duplicate_id_error     if two records share an id;
//     dangling_parent_error  if a parent id has no record;
//     cycle_error            if records can not be reached from any root;
//     zero_radius_error      in strict mode, see topology_options.
//
// Each tree is in breadth-first order from its root, with children in
// input order.
topology build_topology(const std::vector<morph_record>& records, const topology_options& opts = {});

// Record indices in the order build_topology visits them, one sequence per
// root. Throws the same structural errors as build_topology.
std::vector<std::vector<std::size_t>> topological_order(const std::vector<morph_record>& records);

} // namespace csim
