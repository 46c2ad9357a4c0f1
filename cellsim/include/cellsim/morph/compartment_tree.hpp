#pragma once

#include <iosfwd>
#include <vector>

#include <cellsim/common_types.hpp>
#include <cellsim/morph/primitives.hpp>

namespace csim {

// A node of a circuit's compartment tree.
//
// Geometry: the node owns the segment from `prox` to `dist`. For a root
// node both points coincide at the root sample. Relations are handles into
// the owning compartment_tree: `parent` is mnpos for the root.
//
// Electrical state is filled in by discretization and advanced by the
// dynamics engine; a freshly built (geometric) tree leaves it zeroed.

struct compartment_node {
    // Morphology.
    int source_id = 0;             // id of the morphology record the segment ends at
    int tag = 0;                   // structure identifier of that record
    sample_kind kind = sample_kind::undefined;
    mpoint prox = {0, 0, 0, 0};
    mpoint dist = {0, 0, 0, 0};

    // Topology.
    msize_t parent = mnpos;
    std::vector<msize_t> children;

    // Discretization: position in the chain of compartments that
    // represents the source segment.
    msize_t chain_index = 0;
    msize_t chain_size = 1;

    // Cable properties.
    double length = 0;             // [µm]
    double diameter = 0;           // [µm]
    double lambda = 0;             // length constant of the source segment [µm]
    double area = 0;               // membrane area [µm²]
    double axial_resistance = 0;   // end to end resistance [MΩ]
    double capacitance = 0;        // [pF]

    // Dynamic state.
    double voltage = 0;            // [mV]
    double m = 0;                  // Na activation
    double h = 0;                  // Na inactivation
    double n = 0;                  // K activation

    bool is_root() const { return parent==mnpos; }

    // Length in units of the length constant.
    double electrotonic_length() const { return lambda>0? length/lambda: 0; }
};

// An arena of compartment nodes in topological order.
//
// Nodes are appended to an existing parent, so the handle of a parent
// always precedes the handles of its children, and handle 0 is the root.

class compartment_tree {
    std::vector<compartment_node> nodes_;

public:
    compartment_tree() = default;

    // Reserve space for n nodes.
    void reserve(msize_t n);

    // Append a node as the last child of parent p and return its handle.
    // Only the first node may be appended with p==mnpos.
    msize_t append(msize_t p, compartment_node node);

    msize_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    const compartment_node& operator[](msize_t i) const { return nodes_[i]; }
    compartment_node& operator[](msize_t i) { return nodes_[i]; }

    const std::vector<compartment_node>& nodes() const { return nodes_; }

    auto begin() const { return nodes_.begin(); }
    auto end() const { return nodes_.end(); }
    auto begin() { return nodes_.begin(); }
    auto end() { return nodes_.end(); }

    msize_t parent(msize_t i) const { return nodes_[i].parent; }
    const std::vector<msize_t>& children(msize_t i) const { return nodes_[i].children; }

    bool is_root(msize_t i) const { return nodes_[i].parent==mnpos; }
    bool is_fork(msize_t i) const { return nodes_[i].children.size()>1; }
    bool is_terminal(msize_t i) const { return nodes_[i].children.empty(); }

    // The parent index of each node, with -1 for the root.
    std::vector<int> parent_index() const;

    // Handle of the first node built from the given record id, or mnpos.
    msize_t find_source(int source_id) const;

    // Total length of all compartments [µm].
    double total_length() const;

    friend std::ostream& operator<<(std::ostream&, const compartment_tree&);
};

} // namespace csim
