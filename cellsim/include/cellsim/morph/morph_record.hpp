#pragma once

#include <iosfwd>

#include <cellsim/morph/primitives.hpp>

namespace csim {

// One sample of a reconstructed morphology: a point, a radius, a structure
// tag and the id of the parent sample (-1 for a root).

struct morph_record {
    int id = 0;          // sample number
    int tag = 0;         // structure identifier (tag)
    double x = 0;        // sample coordinates [µm]
    double y = 0;
    double z = 0;
    double r = 0;        // sample radius [µm]
    int parent_id = -1;  // record parent's sample number

    morph_record() = default;
    morph_record(int id, int tag, double x, double y, double z, double r, int parent_id):
        id(id), tag(tag), x(x), y(y), z(z), r(r), parent_id(parent_id)
    {}

    sample_kind kind() const { return kind_from_tag(tag); }
    mpoint point() const { return {x, y, z, r}; }
    bool is_root() const { return parent_id==-1; }

    bool operator==(const morph_record& other) const {
        return id == other.id &&
            tag == other.tag &&
            x == other.x &&
            y == other.y &&
            z == other.z &&
            r == other.r &&
            parent_id == other.parent_id;
    }

    bool operator!=(const morph_record& other) const {
        return !(*this == other);
    }

    friend std::ostream& operator<<(std::ostream&, const morph_record&);
};

} // namespace csim
