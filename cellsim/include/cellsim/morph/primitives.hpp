#pragma once

#include <compare>
#include <ostream>
#include <string>

#include <cellsim/common_types.hpp>

//  Types used to describe morphology sample points and their structure.
namespace csim {

// a morphology sample point: a 3D location and radius.
struct mpoint {
    double x, y, z;  // [µm]
    double radius;   // [μm]
    friend std::ostream& operator<<(std::ostream&, const mpoint&);
    auto operator<=>(const mpoint&) const = default;
};

mpoint lerp(const mpoint& a, const mpoint& b, double u);
bool is_collocated(const mpoint& a, const mpoint& b);
double distance(const mpoint& a, const mpoint& b);

// Structure identifier of a morphology sample.
//
// Codes 0-6 follow the standard SWC convention; any other code is kept
// as `custom`, with the numeric tag preserved by the record that carries it.
enum class sample_kind {
    undefined = 0,
    soma = 1,
    axon = 2,
    dendrite = 3,
    apical_dendrite = 4,
    fork_point = 5,
    end_point = 6,
    custom = 7
};

sample_kind kind_from_tag(int tag);
std::string to_string(sample_kind);
std::ostream& operator<<(std::ostream&, sample_kind);

} // namespace csim
