#pragma once

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include <cellsim/csimexcept.hpp>
#include <cellsim/morph/compartment_tree.hpp>
#include <cellsim/morph/morph_record.hpp>

namespace cellsimio {

// SWC exceptions are thrown by `parse_swc` for text that is not a sequence
// of SWC records. Structural problems (duplicate ids, missing parents,
// cycles) are reported later, by csim::build_topology.

struct swc_error: public csim::csim_exception {
    explicit swc_error(const std::string& msg);
};

// A line that is not a well-formed SWC record.
struct swc_parse_error: swc_error {
    swc_parse_error(const std::string& msg, std::size_t line);
    std::size_t line;  // 1-based
};

struct swc_data {
private:
    std::string metadata_;
    std::vector<csim::morph_record> records_;

public:
    swc_data() = default;
    swc_data(std::vector<csim::morph_record>);
    swc_data(std::string, std::vector<csim::morph_record>);

    const std::vector<csim::morph_record>& records() const {return records_;};
    std::string metadata() const {return metadata_;};
};

// Read SWC records from a stream.
//
// Comment lines (first non-blank character '#') and blank lines are
// skipped. Comments before the first record are collected as metadata,
// with the '#' and subsequent whitespace stripped.
//
// A record has exactly seven whitespace separated fields:
//     id kind x y z radius parent-id
// where id is a non-negative integer, kind an integer, parent-id an integer
// not less than -1, and the remainder real numbers. Kind codes outside the
// standard set are kept as custom kinds.
//
// Records are returned in file order. Throws swc_parse_error naming the
// line of the first malformed record.

swc_data parse_swc(std::istream&);
swc_data parse_swc(const std::string&);

// Parse a file. Throws csim::file_not_found_error if it can not be opened.
swc_data load_swc(const std::string& filename);

// Write records, one per line, preceded by the metadata as comments.
void write_swc(std::ostream&, const std::vector<csim::morph_record>&, const std::string& metadata = "");

// Records of a geometric tree in tree order, renumbered from 1, with root
// parent -1.
std::vector<csim::morph_record> to_records(const csim::compartment_tree&);

// Number of records of each kind.
std::map<csim::sample_kind, std::size_t> kind_histogram(const std::vector<csim::morph_record>&);

} // namespace cellsimio
