#include <deque>
#include <map>
#include <ostream>
#include <unordered_map>
#include <vector>

#include <cellsim/csimexcept.hpp>
#include <cellsim/morph/topology.hpp>

namespace csim {

std::ostream& operator<<(std::ostream& o, const zero_radius_warning& w) {
    if (w.radius<0) {
        return o << "negative radius " << w.radius << " for record " << w.id << " of kind " << w.kind;
    }
    return o << "zero radius for record " << w.id << " of kind " << w.kind;
}

std::vector<std::vector<std::size_t>> topological_order(const std::vector<morph_record>& records) {
    const std::size_t n = records.size();

    std::unordered_map<int, std::size_t> index;
    index.reserve(n);
    for (std::size_t i = 0; i<n; ++i) {
        if (!index.emplace(records[i].id, i).second) {
            throw duplicate_id_error(records[i].id);
        }
    }

    // Invert the parent relation, keeping children in input order.
    std::vector<std::vector<std::size_t>> children(n);
    std::vector<std::size_t> roots;
    for (std::size_t i = 0; i<n; ++i) {
        const auto& r = records[i];
        if (r.is_root()) {
            roots.push_back(i);
            continue;
        }
        auto it = index.find(r.parent_id);
        if (it==index.end()) {
            throw dangling_parent_error(r.id, r.parent_id);
        }
        children[it->second].push_back(i);
    }

    // A record is ready once its parent has been emitted.
    std::vector<bool> emitted(n, false);
    std::vector<std::vector<std::size_t>> order;
    order.reserve(roots.size());

    for (auto root: roots) {
        std::vector<std::size_t> seq;
        std::deque<std::size_t> ready{root};
        while (!ready.empty()) {
            auto i = ready.front();
            ready.pop_front();
            emitted[i] = true;
            seq.push_back(i);
            for (auto c: children[i]) {
                ready.push_back(c);
            }
        }
        order.push_back(std::move(seq));
    }

    // Whatever was not reached from a root lies on, or hangs off, a cycle.
    std::vector<int> unreached;
    for (std::size_t i = 0; i<n; ++i) {
        if (!emitted[i]) unreached.push_back(records[i].id);
    }
    if (!unreached.empty()) {
        throw cycle_error(std::move(unreached));
    }

    return order;
}

std::map<sample_kind, std::size_t> kind_counts(const std::vector<morph_record>& records) {
    std::map<sample_kind, std::size_t> counts;
    for (const auto& r: records) {
        ++counts[r.kind()];
    }
    return counts;
}

topology build_topology(const std::vector<morph_record>& records, const topology_options& opts) {
    if (opts.repair_radius && !(*opts.repair_radius>0)) {
        throw bad_parameter("repair-radius", *opts.repair_radius);
    }

    auto order = topological_order(records);

    topology result;
    result.kind_counts = kind_counts(records);

    // Handle of each record in its tree, and its radius after repair.
    std::vector<msize_t> handle(records.size(), mnpos);
    std::vector<double> radius(records.size(), 0);
    std::unordered_map<int, std::size_t> index;
    for (std::size_t i = 0; i<records.size(); ++i) {
        index[records[i].id] = i;
    }

    for (const auto& seq: order) {
        compartment_tree tree;
        tree.reserve(seq.size());

        for (auto i: seq) {
            const auto& r = records[i];

            radius[i] = r.r;
            if (r.r<=0) {
                if (opts.strict && r.kind()!=sample_kind::end_point) {
                    throw zero_radius_error(r.id);
                }
                if (opts.emit_warnings) {
                    result.warnings.push_back({r.id, r.kind(), r.r});
                }
                if (opts.repair_radius) {
                    radius[i] = *opts.repair_radius;
                }
            }

            compartment_node node;
            node.source_id = r.id;
            node.tag = r.tag;
            node.kind = r.kind();
            node.dist = {r.x, r.y, r.z, radius[i]};

            msize_t parent = mnpos;
            if (r.is_root()) {
                node.prox = node.dist;
            }
            else {
                auto p = index.at(r.parent_id);
                const auto& pr = records[p];
                node.prox = {pr.x, pr.y, pr.z, radius[p]};
                parent = handle[p];
            }

            handle[i] = tree.append(parent, std::move(node));
        }

        result.trees.push_back(std::move(tree));
    }

    return result;
}

} // namespace csim
