#include <cmath>
#include <ios>
#include <limits>
#include <ostream>
#include <string>

#include <cellsim/math.hpp>
#include <cellsim/morph/morph_record.hpp>
#include <cellsim/morph/primitives.hpp>

namespace csim {

// interpolate between two points.
mpoint lerp(const mpoint& a, const mpoint& b, double u) {
    return { math::lerp(a.x, b.x, u),
             math::lerp(a.y, b.y, u),
             math::lerp(a.z, b.z, u),
             math::lerp(a.radius, b.radius, u) };
}

// test if two morphology sample points share the same location.
bool is_collocated(const mpoint& a, const mpoint& b) {
    return a.x==b.x && a.y==b.y && a.z==b.z;
}

// calculate the distance between two morphology sample points.
double distance(const mpoint& a, const mpoint& b) {
    double dx = a.x - b.x;
    double dy = a.y - b.y;
    double dz = a.z - b.z;

    return std::sqrt(dx*dx + dy*dy + dz*dz);
}

sample_kind kind_from_tag(int tag) {
    if (tag<0 || tag>6) return sample_kind::custom;
    return static_cast<sample_kind>(tag);
}

std::string to_string(sample_kind k) {
    switch (k) {
    case sample_kind::undefined:       return "undefined";
    case sample_kind::soma:            return "soma";
    case sample_kind::axon:            return "axon";
    case sample_kind::dendrite:        return "dendrite";
    case sample_kind::apical_dendrite: return "apical-dendrite";
    case sample_kind::fork_point:      return "fork-point";
    case sample_kind::end_point:       return "end-point";
    case sample_kind::custom:          return "custom";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& o, sample_kind k) {
    return o << to_string(k);
}

std::ostream& operator<<(std::ostream& o, const mpoint& p) {
    return o << "(point " << p.x << " " << p.y << " " << p.z << " " << p.radius << ")";
}

// Records are written in the SWC layout: id tag x y z r parent.
std::ostream& operator<<(std::ostream& out, const morph_record& record) {
    std::ios_base::fmtflags flags(out.flags());
    auto precision = out.precision();

    out.precision(std::numeric_limits<double>::digits10+2);
    out << record.id << ' ' << record.tag << ' '
        << record.x  << ' ' << record.y   << ' ' << record.z << ' ' << record.r << ' '
        << record.parent_id << '\n';

    out.precision(precision);
    out.flags(flags);

    return out;
}

std::ostream& operator<<(std::ostream& o, dynamics_state s) {
    switch (s) {
    case dynamics_state::unstarted: return o << "unstarted";
    case dynamics_state::running:   return o << "running";
    case dynamics_state::completed: return o << "completed";
    case dynamics_state::halted:    return o << "halted";
    }
    return o;
}

} // namespace csim
