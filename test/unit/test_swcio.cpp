#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <cellsim/csimexcept.hpp>
#include <cellsim/morph/morph_record.hpp>
#include <cellsim/morph/topology.hpp>

#include <cellsimio/swcio.hpp>

#include <gtest/gtest.h>

#include "common_morphologies.hpp"

using namespace cellsimio;
using csim::morph_record;
using csim::sample_kind;

TEST(morph_record, construction) {
    morph_record record(1, 7, 1., 2., 3., 4., -1);
    EXPECT_EQ(record.id, 1);
    EXPECT_EQ(record.tag, 7);
    EXPECT_EQ(record.x, 1.);
    EXPECT_EQ(record.y, 2.);
    EXPECT_EQ(record.z, 3.);
    EXPECT_EQ(record.r, 4.);
    EXPECT_EQ(record.parent_id, -1);
    EXPECT_TRUE(record.is_root());
    EXPECT_EQ(sample_kind::custom, record.kind());

    morph_record r2(record);
    EXPECT_EQ(record, r2);

    morph_record r3;
    EXPECT_NE(record, r3);

    r3 = record;
    EXPECT_EQ(record, r3);
}

TEST(morph_record, kinds) {
    EXPECT_EQ(sample_kind::undefined,       csim::kind_from_tag(0));
    EXPECT_EQ(sample_kind::soma,            csim::kind_from_tag(1));
    EXPECT_EQ(sample_kind::axon,            csim::kind_from_tag(2));
    EXPECT_EQ(sample_kind::dendrite,        csim::kind_from_tag(3));
    EXPECT_EQ(sample_kind::apical_dendrite, csim::kind_from_tag(4));
    EXPECT_EQ(sample_kind::fork_point,      csim::kind_from_tag(5));
    EXPECT_EQ(sample_kind::end_point,       csim::kind_from_tag(6));
    EXPECT_EQ(sample_kind::custom,          csim::kind_from_tag(7));
    EXPECT_EQ(sample_kind::custom,          csim::kind_from_tag(42));
    EXPECT_EQ(sample_kind::custom,          csim::kind_from_tag(-3));
}

TEST(swc_parser, records) {
    std::string text =
        "1 1 0 0 0 5.0 -1\n"
        "2 3 10 0 0 2.0 1\n";

    auto data = parse_swc(text);
    ASSERT_EQ(2u, data.records().size());
    EXPECT_EQ(common_morphology::ball_and_stick(), data.records());
    EXPECT_EQ("", data.metadata());
}

TEST(swc_parser, metadata) {
    std::string text =
        "# Hello\n"
        "#   world.\n"
        "#\n"
        "1 1 0 0 0 5.0 -1\n"
        "# not metadata\n"
        "2 3 10 0 0 2.0 1\n";

    auto data = parse_swc(text);
    EXPECT_EQ("Hello\nworld.\n\n", data.metadata());
    EXPECT_EQ(2u, data.records().size());
}

TEST(swc_parser, comments_and_blank_lines) {
    std::string text =
        "\n"
        "   # indented comment\n"
        "1 1 0 0 0 5.0 -1\n"
        "\n"
        "  \t \n"
        "# comment between records\n"
        "\t2 3 10   0 0 2.0 1   \r\n";

    auto data = parse_swc(text);
    ASSERT_EQ(2u, data.records().size());
    EXPECT_EQ(common_morphology::ball_and_stick(), data.records());
}

TEST(swc_parser, file_order) {
    // Records are not sorted or validated by the parser.
    std::string text =
        "5 3 1 1 1 1 3\n"
        "3 1 0 0 0 1 -1\n"
        "5 2 2 2 2 1 3\n"
        "7 3 3 3 3 1 99\n";

    auto data = parse_swc(text);
    ASSERT_EQ(4u, data.records().size());
    EXPECT_EQ(5, data.records()[0].id);
    EXPECT_EQ(3, data.records()[1].id);
    EXPECT_EQ(5, data.records()[2].id);
    EXPECT_EQ(99, data.records()[3].parent_id);
}

TEST(swc_parser, custom_kind) {
    auto data = parse_swc("1 42 0 0 0 1 -1\n2 6 1 0 0 0.5 1\n");
    ASSERT_EQ(2u, data.records().size());
    EXPECT_EQ(42, data.records()[0].tag);
    EXPECT_EQ(sample_kind::custom, data.records()[0].kind());
    EXPECT_EQ(sample_kind::end_point, data.records()[1].kind());
}

TEST(swc_parser, real_fields) {
    auto data = parse_swc("1 1 -1.5e1 2.25 .5 3e-1 -1\n");
    ASSERT_EQ(1u, data.records().size());
    const auto& r = data.records()[0];
    EXPECT_EQ(-15., r.x);
    EXPECT_EQ(2.25, r.y);
    EXPECT_EQ(0.5, r.z);
    EXPECT_EQ(0.3, r.r);
}

TEST(swc_parser, malformed) {
    auto line_of_error = [](const std::string& text) -> std::size_t {
        try {
            parse_swc(text);
        }
        catch (swc_parse_error& e) {
            return e.line;
        }
        return 0;
    };

    // Missing parent id.
    EXPECT_THROW(parse_swc("1 1 14.566132 34.873772 7.857000 0.717830\n"), swc_parse_error);
    EXPECT_EQ(2u, line_of_error("# comment\n1 1 14.566132 34.873772 7.857000 0.717830\n"));

    // Extra field.
    EXPECT_EQ(1u, line_of_error("1 1 0 0 0 1 -1 7\n"));

    // Bad id value.
    EXPECT_EQ(3u, line_of_error("1 1 0 0 0 1 -1\n\n1a 1 0 0 0 1 -1\n"));

    // Non-integral id, kind and parent.
    EXPECT_EQ(1u, line_of_error("1.5 1 0 0 0 1 -1\n"));
    EXPECT_EQ(1u, line_of_error("1 1.0 0 0 0 1 -1\n"));
    EXPECT_EQ(1u, line_of_error("2 1 0 0 0 1 1.5\n"));

    // Bad coordinate and radius.
    EXPECT_EQ(2u, line_of_error("1 1 0 0 0 1 -1\n2 1 0 x 0 1 1\n"));
    EXPECT_EQ(1u, line_of_error("1 1 0 0 0 1r -1\n"));

    // Non-finite coordinate and radius.
    EXPECT_EQ(1u, line_of_error("1 1 nan 0 0 5 -1\n2 3 10 0 0 2 1\n"));
    EXPECT_EQ(2u, line_of_error("1 1 0 0 0 5 -1\n2 3 10 0 0 inf 1\n"));
    EXPECT_EQ(2u, line_of_error("1 1 0 0 0 5 -1\n2 3 10 -infinity 0 2 1\n"));

    // Negative id, and parent ids below -1.
    EXPECT_EQ(1u, line_of_error("-1 1 0 0 0 1 -1\n"));
    EXPECT_EQ(1u, line_of_error("1 1 0 0 0 1 -2\n"));

    // Overflow.
    EXPECT_EQ(1u, line_of_error("99999999999999999999 1 0 0 0 1 -1\n"));
}

TEST(swc_parser, duplicate_ids_pass) {
    // Duplicates are a topology error, not a parse error.
    auto data = parse_swc("1 1 0 0 0 1 -1\n1 3 1 0 0 1 -1\n");
    EXPECT_EQ(2u, data.records().size());
    EXPECT_THROW(csim::build_topology(data.records()), csim::duplicate_id_error);
}

TEST(swc_parser, error_message) {
    try {
        parse_swc("1 1 0 0 0\n");
        FAIL() << "expected swc_parse_error";
    }
    catch (csim::csim_exception& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("line 1"));
    }
}

TEST(swc_io, load_file) {
    EXPECT_THROW(load_swc("this-file-does-not-exist.swc"), csim::file_not_found_error);

    std::string fn = testing::TempDir()+"cellsim_test_load.swc";
    {
        std::ofstream f(fn);
        f << "# ball and stick\n1 1 0 0 0 5.0 -1\n2 3 10 0 0 2.0 1\n";
    }
    auto data = load_swc(fn);
    EXPECT_EQ("ball and stick\n", data.metadata());
    EXPECT_EQ(common_morphology::ball_and_stick(), data.records());
    std::remove(fn.c_str());
}

TEST(swc_io, write) {
    std::vector<morph_record> records = {
        {1, 1, 0.25, 0, 0, 5.0, -1},
        {2, 42, 10, -3, 1e-3, 2.0, 1},
    };

    std::ostringstream out;
    write_swc(out, records, "line one\nline two\n");

    auto data = parse_swc(out.str());
    EXPECT_EQ(records, data.records());
    EXPECT_EQ("line one\nline two\n", data.metadata());
}

TEST(swc_io, to_records) {
    // Parents listed after their children, with sparse ids.
    std::vector<morph_record> input = {
        {30, 3, 20, 0, 0, 1, 20},
        {20, 3, 10, 0, 0, 1, 10},
        {10, 1,  0, 0, 0, 5, -1},
        {40, 2,  0,-10, 0, 1, 10},
    };
    auto topo = csim::build_topology(input);
    ASSERT_EQ(1u, topo.trees.size());

    auto out = to_records(topo.trees[0]);
    std::vector<morph_record> expected = {
        {1, 1,  0,  0, 0, 5, -1},
        {2, 3, 10,  0, 0, 1,  1},
        {3, 2,  0,-10, 0, 1,  1},
        {4, 3, 20,  0, 0, 1,  2},
    };
    EXPECT_EQ(expected, out);

    // The processed records describe the same tree.
    auto again = csim::build_topology(out);
    ASSERT_EQ(1u, again.trees.size());
    EXPECT_EQ(topo.trees[0].parent_index(), again.trees[0].parent_index());
}

TEST(swc_io, kind_histogram) {
    auto counts = kind_histogram(common_morphology::forked_cell());
    EXPECT_EQ(3u, counts.size());
    EXPECT_EQ(1u, counts[sample_kind::soma]);
    EXPECT_EQ(3u, counts[sample_kind::dendrite]);
    EXPECT_EQ(1u, counts[sample_kind::axon]);
    EXPECT_TRUE(kind_histogram({}).empty());
}
