#include "bench_main.hpp"

#include "ebml/codec/primitive.hpp"
#include "ebml/core/log.hpp"
#include "ebml/core/source.hpp"
#include "ebml/schema/segment.hpp"
#include "ebml/tree/parser.hpp"
#include "ebml/utils/node_dump.hpp"

#include <cstdint>
#include <iostream>
#include <string_view>
#include <vector>

using namespace ebml;
using core::byte;

namespace {

void put_id(std::vector<byte>& out, std::uint64_t id) {
  int n = 1;
  while (n < 8 && (id >> (8 * n)) != 0) {
    ++n;
  }
  for (int i = n - 1; i >= 0; --i) {
    out.push_back(static_cast<byte>((id >> (8 * i)) & 0xFFu));
  }
}

void put_element(std::vector<byte>& out, std::uint64_t id, const std::vector<byte>& payload) {
  put_id(out, id);
  if (auto ec = codec::encode_vint(payload.size(), out)) {
    std::cerr << "encode_vint failed: " << ec.message() << "\n";
  }
  out.insert(out.end(), payload.begin(), payload.end());
}

void put_uint(std::vector<byte>& out, std::uint64_t id, std::uint64_t v) {
  std::vector<byte> payload;
  for (int shift = 24; shift >= 0; shift -= 8) {
    payload.push_back(static_cast<byte>((v >> shift) & 0xFFu));
  }
  put_element(out, id, payload);
}

void put_string(std::vector<byte>& out, std::uint64_t id, std::string_view s) {
  put_element(out, id, std::vector<byte>(s.begin(), s.end()));
}

// 合成 WebM：clusters 个 Cluster，每个含 blocks 个 frame_size 字节的 SimpleBlock。
std::vector<byte> make_webm(std::size_t clusters, std::size_t blocks, std::size_t frame_size) {
  namespace id = schema::id;

  std::vector<byte> header;
  put_uint(header, id::kEBMLVersion, 1);
  put_uint(header, id::kEBMLReadVersion, 1);
  put_uint(header, id::kEBMLMaxIDLength, 4);
  put_uint(header, id::kEBMLMaxSizeLength, 8);
  put_string(header, id::kDocType, "webm");
  put_uint(header, id::kDocTypeVersion, 4);
  put_uint(header, id::kDocTypeReadVersion, 2);

  std::vector<byte> segment;
  std::vector<byte> info;
  put_uint(info, id::kTimestampScale, 1000000);
  put_string(info, id::kMuxingApp, "bench");
  put_string(info, id::kWritingApp, "bench");
  put_element(segment, id::kInfo, info);

  std::vector<byte> frame(frame_size, 0x5A);
  for (std::size_t c = 0; c < clusters; ++c) {
    std::vector<byte> cluster;
    put_uint(cluster, id::kTimestamp, c * 1000);
    for (std::size_t b = 0; b < blocks; ++b) {
      std::vector<byte> block{0x81, 0x00, static_cast<byte>(b & 0x7F), 0x80};
      block.insert(block.end(), frame.begin(), frame.end());
      put_element(cluster, id::kSimpleBlock, block);
    }
    put_element(segment, id::kCluster, cluster);
  }

  std::vector<byte> out;
  put_element(out, id::kEBML, header);
  put_element(out, id::kSegment, segment);
  return out;
}

void bench_vint_decode() {
  std::vector<byte> encoded;
  for (std::uint64_t v = 0; v < 100000; ++v) {
    if (auto ec = codec::encode_vint(v * 977, encoded)) {
      std::cerr << "encode_vint failed: " << ec.message() << "\n";
      return;
    }
  }

  std::uint64_t checksum = 0;
  BENCH_RUN("codec: decode 100k vints", encoded.size(), 10, {
    core::bytes_view in{encoded.data(), encoded.size()};
    while (!in.empty()) {
      std::uint64_t value = 0;
      std::size_t length = 0;
      if (codec::decode_vint(in, value, length)) {
        break;
      }
      checksum += value;
      in = in.subspan(length);
    }
  });
  if (checksum == 0) {
    std::cerr << "unexpected checksum\n";
  }
}

void bench_parse_document(std::string_view name, std::size_t clusters, std::size_t blocks, std::size_t frame) {
  const auto data = make_webm(clusters, blocks, frame);

  BENCH_RUN(name, data.size(), 5, {
    core::MemorySource src(core::bytes_view{data.data(), data.size()});
    tree::Document doc;
    if (auto ec = tree::parse_document(src, doc)) {
      std::cerr << "parse failed: " << ec.message() << "\n";
    }
  });
}

void bench_view_walk() {
  const auto data = make_webm(200, 50, 64);
  core::MemorySource src(core::bytes_view{data.data(), data.size()});
  tree::Document doc;
  if (auto ec = tree::parse_document(src, doc)) {
    std::cerr << "parse failed: " << ec.message() << "\n";
    return;
  }

  std::size_t total_blocks = 0;
  BENCH_RUN("schema: walk clusters + simple blocks", data.size(), 10, {
    for (const auto& cluster : schema::segment_of(doc).clusters()) {
      std::uint64_t ts = 0;
      std::vector<core::bytes_view> blocks;
      if (cluster.timestamp(ts) || cluster.simple_blocks(blocks)) {
        break;
      }
      for (const auto block : blocks) {
        schema::BlockHeader h;
        if (!schema::parse_block_header(block, h)) {
          ++total_blocks;
        }
      }
    }
  });

  std::size_t dumped = 0;
  BENCH_RUN("utils: dump_document", data.size(), 3, { dumped += utils::dump_document(doc).size(); });
  if (total_blocks == 0 || dumped == 0) {
    std::cerr << "unexpected empty walk\n";
  }
}

}  // namespace

int main() {
  core::set_log_level(core::LogLevel::off);

  bench_vint_decode();
  bench_parse_document("tree: parse 10 clusters x 10 blocks", 10, 10, 256);
  bench_parse_document("tree: parse 200 clusters x 50 blocks", 200, 50, 64);
  bench_parse_document("tree: parse 20 clusters x 20 x 16KB", 20, 20, 16 * 1024);
  bench_view_walk();

  ebml::benchmarks::print_results();
  return 0;
}
