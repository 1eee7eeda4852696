#include "ebml/utils/hex.hpp"
#include "ebml/utils/node_dump.hpp"
#include "ebml/utils/parse_helpers.hpp"

#include "ebml_builder.hpp"
#include "test_main.hpp"

#include <string>
#include <vector>

namespace {

namespace id = ebml::schema::id;
using ebml::tests::bytes;
using ebml::tests::float_element;
using ebml::tests::int_element;
using ebml::tests::master;
using ebml::tests::string_element;
using ebml::tests::uint_element;
using ebml::tests::view;
using ebml::utils::dump_node;
using ebml::utils::hex_dump;
using ebml::utils::HexDumpOptions;
using ebml::utils::NodeDumpOptions;
using ebml::utils::parse_hex;
using ebml::utils::to_hex;

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void test_hex_dump_layout() {
  std::vector<ebml::core::byte> data;
  for (int i = 0; i < 20; ++i) {
    data.push_back(static_cast<ebml::core::byte>(0x41 + i));
  }

  const auto plain = hex_dump(view(data));
  TEST_EXPECT(contains(plain, "0000: 41 42 43"));
  TEST_EXPECT(contains(plain, "0010: 51 52 53 54\n"));

  HexDumpOptions options;
  options.show_offset = false;
  options.show_ascii = true;
  options.bytes_per_line = 8;
  const auto with_ascii = hex_dump(view(data), options);
  TEST_EXPECT(contains(with_ascii, "41 42 43 44 45 46 47 48  ABCDEFGH\n"));

  options.max_bytes = 4;
  const auto truncated = hex_dump(view(data), options);
  TEST_EXPECT(contains(truncated, "... (truncated, total=20 bytes)"));

  TEST_EXPECT(hex_dump(ebml::core::bytes_view{}).empty());
}

void test_to_hex() {
  const bytes data{0x1A, 0x45, 0xDF, 0xA3};
  TEST_EXPECT_EQ(to_hex(view(data)), "1A 45 DF A3");
  TEST_EXPECT_EQ(to_hex(view(data), 2), "1A 45 ...");
  TEST_EXPECT_EQ(to_hex(ebml::core::bytes_view{}), "");
}

void test_parse_hex() {
  std::vector<ebml::core::byte> out;
  TEST_EXPECT_OK(parse_hex("1a 45:DF-a3", out));
  TEST_EXPECT_EQ(out, (std::vector<ebml::core::byte>{0x1A, 0x45, 0xDF, 0xA3}));

  TEST_EXPECT_OK(parse_hex("0x42 0x86 0x81 0x01", out));
  TEST_EXPECT_EQ(out, (std::vector<ebml::core::byte>{0x42, 0x86, 0x81, 0x01}));

  TEST_EXPECT_OK(parse_hex("", out));
  TEST_EXPECT(out.empty());

  out = {0x01};
  TEST_EXPECT_ERR(parse_hex("ABC", out), ebml::core::errc::invalid_argument);
  TEST_EXPECT_ERR(parse_hex("zz", out), ebml::core::errc::invalid_argument);
  // 失败时 out 不变。
  TEST_EXPECT_EQ(out.size(), 1u);
}

void test_dump_document() {
  const auto data = ebml::tests::concat({
    ebml::tests::ebml_header(),
    master(id::kSegment,
           {
             master(id::kInfo,
                    {
                      uint_element(id::kTimestampScale, 1000000),
                      float_element(id::kDuration, 12.5),
                      int_element(id::kDateUTC, -3),
                      string_element(id::kMuxingApp, "mux\"er"),
                    }),
             ebml::tests::element(0x4F00, bytes{0xCA, 0xFE}),
             ebml::tests::element(id::kVoid, bytes{}),
           }),
  });
  auto [ec, doc] = ebml::utils::parse_document_bytes(view(data));
  TEST_EXPECT_OK(ec);

  const auto text = ebml::utils::dump_document(doc);
  TEST_EXPECT(contains(text, "[0x1A45DFA3] EBML (master, size="));
  TEST_EXPECT(contains(text, "  [0x4282] DocType (string, size=4) = \"webm\"\n"));
  TEST_EXPECT(contains(text, "[0x18538067] Segment (master"));
  TEST_EXPECT(contains(text, "    [0x2AD7B1] TimestampScale (uinteger, size=3) = 1000000\n"));
  TEST_EXPECT(contains(text, "Duration (float, size=8) = 12.5\n"));
  TEST_EXPECT(contains(text, "DateUTC (date, size=1) = -3\n"));
  TEST_EXPECT(contains(text, "MuxingApp (utf-8, size=6) = \"mux\\\"er\"\n"));
  TEST_EXPECT(contains(text, "  [0x4F00] Unknown (unknown, size=2) = CA FE\n"));
  TEST_EXPECT(contains(text, "  [0xEC] Void (binary, size=0)\n"));
}

void test_dump_options() {
  const auto data = master(id::kTracks,
                           {
                             master(id::kTrackEntry, {uint_element(id::kTrackNumber, 1)}),
                             master(id::kTrackEntry, {uint_element(id::kTrackNumber, 2)}),
                             master(id::kTrackEntry, {uint_element(id::kTrackNumber, 3)}),
                           });
  auto [ec, result] = ebml::utils::build_tree_bytes(view(data));
  TEST_EXPECT_OK(ec);

  NodeDumpOptions options;
  options.max_depth = 0;
  const auto shallow = dump_node(result.node, options);
  TEST_EXPECT(contains(shallow, "{ ... 3 children }"));
  TEST_EXPECT(!contains(shallow, "TrackNumber"));

  options.max_depth = 8;
  options.max_children = 2;
  options.indent_spaces = 4;
  options.show_offset = true;
  const auto limited = dump_node(result.node, options);
  TEST_EXPECT(contains(limited, "    [0xAE] TrackEntry (master, size=3 @5)\n"));
  TEST_EXPECT(contains(limited, "    ... (1 more)\n"));

  options.enable_color = true;
  TEST_EXPECT(contains(dump_node(result.node, options), "\033["));
}

void test_dump_string_cut_on_character_boundary() {
  // "ab" + U+4F55 (3 字节) + "c"
  const auto data = string_element(id::kTitle, "ab\xE4\xBD\x95" "c");
  auto [ec, result] = ebml::utils::build_tree_bytes(view(data));
  TEST_EXPECT_OK(ec);

  NodeDumpOptions options;
  options.max_payload_bytes = 3;
  TEST_EXPECT(contains(dump_node(result.node, options), "Title (utf-8, size=6) = \"ab...\"\n"));

  options.max_payload_bytes = 4;
  TEST_EXPECT(contains(dump_node(result.node, options), "= \"ab...\"\n"));

  options.max_payload_bytes = 5;
  TEST_EXPECT(contains(dump_node(result.node, options), "= \"ab\xE4\xBD\x95...\"\n"));

  options.max_payload_bytes = 0;
  TEST_EXPECT(contains(dump_node(result.node, options), "= \"ab\xE4\xBD\x95" "c\"\n"));
}

}  // namespace

int main() {
  test_hex_dump_layout();
  test_to_hex();
  test_parse_hex();
  test_dump_document();
  test_dump_options();
  test_dump_string_cut_on_character_boundary();
  return ::ebml::tests::run_and_report();
}
