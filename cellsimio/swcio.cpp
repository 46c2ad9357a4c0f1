#include <cmath>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <cellsim/csimexcept.hpp>
#include <cellsim/morph/compartment_tree.hpp>
#include <cellsim/morph/morph_record.hpp>
#include <cellsim/morph/topology.hpp>

#include <cellsimio/swcio.hpp>

namespace cellsimio {

// SWC exceptions:

swc_error::swc_error(const std::string& msg):
    csim_exception(msg)
{}

swc_parse_error::swc_parse_error(const std::string& msg, std::size_t line):
    swc_error("SWC parse error on line "+std::to_string(line)+": "+msg),
    line(line)
{}

// swc_data

swc_data::swc_data(std::vector<csim::morph_record> recs):
    metadata_(),
    records_(std::move(recs))
{}

swc_data::swc_data(std::string meta, std::vector<csim::morph_record> recs):
    metadata_(std::move(meta)),
    records_(std::move(recs))
{}

namespace {

const char* const field_names[] = {"id", "kind", "x", "y", "z", "radius", "parent-id"};

// The whole token must be consumed by the conversion.
int parse_int_field(const std::string& tok, int field, std::size_t line) {
    std::size_t pos = 0;
    int v;
    try {
        v = std::stoi(tok, &pos);
    }
    catch (std::logic_error&) {
        throw swc_parse_error("invalid "+std::string(field_names[field])+" '"+tok+"'", line);
    }
    if (pos!=tok.size()) {
        throw swc_parse_error("invalid "+std::string(field_names[field])+" '"+tok+"'", line);
    }
    return v;
}

double parse_real_field(const std::string& tok, int field, std::size_t line) {
    std::size_t pos = 0;
    double v;
    try {
        v = std::stod(tok, &pos);
    }
    catch (std::logic_error&) {
        throw swc_parse_error("invalid "+std::string(field_names[field])+" '"+tok+"'", line);
    }
    if (pos!=tok.size() || !std::isfinite(v)) {
        throw swc_parse_error("invalid "+std::string(field_names[field])+" '"+tok+"'", line);
    }
    return v;
}

csim::morph_record parse_record(const std::string& text, std::size_t line) {
    std::istringstream s(text);
    std::vector<std::string> tok;
    for (std::string t; s >> t;) tok.push_back(std::move(t));

    if (tok.size()!=7) {
        throw swc_parse_error("expected 7 fields, found "+std::to_string(tok.size()), line);
    }

    csim::morph_record r;
    r.id = parse_int_field(tok[0], 0, line);
    r.tag = parse_int_field(tok[1], 1, line);
    r.x = parse_real_field(tok[2], 2, line);
    r.y = parse_real_field(tok[3], 3, line);
    r.z = parse_real_field(tok[4], 4, line);
    r.r = parse_real_field(tok[5], 5, line);
    r.parent_id = parse_int_field(tok[6], 6, line);

    if (r.id<0) {
        throw swc_parse_error("negative id "+tok[0], line);
    }
    if (r.parent_id<-1) {
        throw swc_parse_error("invalid parent-id "+tok[6], line);
    }
    return r;
}

} // anonymous namespace

swc_data parse_swc(std::istream& in) {
    std::string metadata;
    std::vector<csim::morph_record> records;

    std::string line;
    std::size_t lineno = 0;
    while (getline(in, line, '\n')) {
        ++lineno;

        auto from = line.find_first_not_of(" \t\r");
        if (from==std::string::npos) continue;

        if (line[from]=='#') {
            // Collect any initial comments.
            if (records.empty()) {
                auto text = line.find_first_not_of(" \t", from+1);
                if (text!=std::string::npos) {
                    auto to = line.find_last_not_of("\r");
                    metadata.append(line, text, to+1-text);
                }
                metadata += '\n';
            }
            continue;
        }

        records.push_back(parse_record(line, lineno));
    }

    return swc_data(std::move(metadata), std::move(records));
}

swc_data parse_swc(const std::string& text) {
    std::istringstream is(text);
    return parse_swc(is);
}

swc_data load_swc(const std::string& filename) {
    std::ifstream f(filename);
    if (!f) throw csim::file_not_found_error(filename);
    return parse_swc(f);
}

void write_swc(std::ostream& out, const std::vector<csim::morph_record>& records, const std::string& metadata) {
    std::istringstream meta(metadata);
    for (std::string line; getline(meta, line, '\n');) {
        out << "# " << line << '\n';
    }
    for (const auto& r: records) {
        out << r;
    }
}

std::vector<csim::morph_record> to_records(const csim::compartment_tree& tree) {
    std::vector<csim::morph_record> records;
    records.reserve(tree.size());

    for (csim::msize_t i = 0; i<tree.size(); ++i) {
        const auto& c = tree[i];
        const auto& p = c.dist;
        int parent = c.is_root()? -1: int(c.parent)+1;
        records.emplace_back(int(i)+1, c.tag, p.x, p.y, p.z, p.radius, parent);
    }
    return records;
}

std::map<csim::sample_kind, std::size_t> kind_histogram(const std::vector<csim::morph_record>& records) {
    return csim::kind_counts(records);
}

} // namespace cellsimio
