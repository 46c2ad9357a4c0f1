#pragma once

#include <cellsim/cable_params.hpp>
#include <cellsim/common_types.hpp>
#include <cellsim/morph/compartment_tree.hpp>

// Spatial discretization by the d-lambda rule.
//
// Each geometric segment of a tree, from its parent's sample to its own, is
// represented by a chain of n compartments of equal length, where n is the
// number of d_lambda·λ(f) lengths needed to cover the segment. λ(f) is the
// AC length constant of the segment's cable at frequency f.
//
// The root sample is a single compartment: a cylinder with length and
// diameter equal to the sample's diameter, whose lateral area equals the
// surface of the sphere the sample describes.
//
// Segments of zero length are merged into their parent's compartment.

namespace csim {

// AC length constant [µm] of a cable of the given diameter [µm], for axial
// resistivity Ra [Ω·cm], specific capacitance Cm [µF/cm²] and frequency [Hz]:
//
//     λ = 1e5·√(d/(4π·f·Ra·Cm))
//
// Returns 0 if no positive length constant exists.
double length_constant(double diameter, double Ra, double Cm, double frequency);

// Number of compartments for a segment of given length and length constant.
// At least one. Throws compartment_count_error above max_chain_size.
msize_t dlambda_count(double length, double lambda, const dlambda_policy& policy);

// Fill the cable properties of a compartment (area, capacitance, axial
// resistance) from its length and diameter.
void set_cable_properties(compartment_node& node, const membrane_parameters& mp);

// Discretize a geometric tree.
//
// Throws invalid_geometry_error if a segment has no positive length
// constant, compartment_count_error if a segment would need more than
// max_chain_size compartments, and bad_parameter for invalid membrane or policy values. The
// input tree is left untouched on failure.
compartment_tree discretize(const compartment_tree& geometry,
                            const membrane_parameters& mp,
                            const dlambda_policy& policy);

} // namespace csim
