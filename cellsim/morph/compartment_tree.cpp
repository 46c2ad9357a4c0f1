#include <ostream>
#include <utility>
#include <vector>

#include <cellsim/csimexcept.hpp>
#include <cellsim/morph/compartment_tree.hpp>

namespace csim {

void compartment_tree::reserve(msize_t n) {
    nodes_.reserve(n);
}

msize_t compartment_tree::append(msize_t p, compartment_node node) {
    const msize_t id = size();
    // Only the root may be parentless, and parents must already exist.
    if ((p==mnpos && id!=0) || (p!=mnpos && p>=id)) {
        throw invalid_compartment_parent(p, id);
    }

    node.parent = p;
    node.children.clear();
    nodes_.push_back(std::move(node));
    if (p!=mnpos) {
        nodes_[p].children.push_back(id);
    }

    return id;
}

std::vector<int> compartment_tree::parent_index() const {
    std::vector<int> p;
    p.reserve(size());
    for (auto& n: nodes_) {
        p.push_back(n.parent==mnpos? -1: int(n.parent));
    }
    return p;
}

msize_t compartment_tree::find_source(int source_id) const {
    for (msize_t i = 0; i<size(); ++i) {
        if (nodes_[i].source_id==source_id) return i;
    }
    return mnpos;
}

double compartment_tree::total_length() const {
    double L = 0;
    for (auto& n: nodes_) L += n.length;
    return L;
}

std::ostream& operator<<(std::ostream& o, const compartment_tree& t) {
    o << "(compartment-tree";
    for (msize_t i = 0; i<t.size(); ++i) {
        const auto& n = t[i];
        o << "\n  (" << i << " " << (n.parent==mnpos? -1: (long long)n.parent)
          << " " << n.source_id << " " << n.kind << " " << n.prox << " " << n.dist << ")";
    }
    return o << ")";
}

} // namespace csim
