/**
 * @file webm_dump.cpp
 * @brief 解析 WebM/Matroska 文件（或一段十六进制字节），输出元素树与轨道摘要
 *
 * 运行：
 * - ./build/examples/webm_dump <file.webm> [--depth N] [--color] [--log-level debug]
 * - ./build/examples/webm_dump --hex "1A 45 DF A3 ..." [--depth N]
 *
 * 说明：打开文件由本程序负责；解析库只面向已打开的字节源。
 */

#include <ebml/core/log.hpp>
#include <ebml/core/source.hpp>
#include <ebml/schema/segment.hpp>
#include <ebml/tree/parser.hpp>
#include <ebml/utils/hex.hpp>
#include <ebml/utils/node_dump.hpp>
#include <ebml/utils/parse_helpers.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace ebml;

namespace {

void print_usage(const char *argv0) {
  std::cout << "usage:\n";
  std::cout << "  " << argv0 << " <file.webm> [--depth N] [--color] [--log-level LEVEL]\n";
  std::cout << "  " << argv0 << " --hex \"<hex>\" [--depth N] [--color] [--log-level LEVEL]\n";
}

std::string_view track_type_name(std::uint64_t type) {
  switch (type) {
    case 1:
      return "video";
    case 2:
      return "audio";
    case 3:
      return "complex";
    case 0x10:
      return "logo";
    case 0x11:
      return "subtitle";
    case 0x12:
      return "buttons";
    case 0x20:
      return "control";
    default:
      return "other";
  }
}

void print_track_summary(const tree::Document &doc) {
  const auto header = schema::header_of(doc);
  std::string doc_type;
  if (auto ec = header.doc_type(doc_type)) {
    doc_type = "<" + ec.message() + ">";
  }
  std::cout << "DocType: " << doc_type << "\n";

  const auto segment = schema::segment_of(doc);
  for (const auto &info : segment.infos()) {
    std::uint64_t scale = 0;
    std::optional<double> duration;
    if (!info.timestamp_scale(scale) && !info.duration(duration) && duration) {
      std::cout << "Duration: " << (*duration * static_cast<double>(scale) / 1e9) << " s\n";
    }
  }

  std::size_t cluster_count = segment.clusters().size();
  std::cout << "Clusters: " << cluster_count << "\n";

  for (const auto &tracks : segment.tracks()) {
    for (const auto &entry : tracks.track_entries()) {
      std::uint64_t number = 0;
      std::uint64_t type = 0;
      std::string codec;
      const auto ec1 = entry.track_number(number);
      const auto ec2 = entry.track_type(type);
      const auto ec3 = entry.codec_id(codec);
      if (ec1 || ec2 || ec3) {
        std::cout << "  track: incomplete entry ("
                  << (ec1 ? ec1 : (ec2 ? ec2 : ec3)).message() << ")\n";
        continue;
      }
      std::cout << "  track #" << number << " " << track_type_name(type) << " " << codec;

      if (const auto video = entry.video()) {
        std::uint64_t w = 0;
        std::uint64_t h = 0;
        if (!video->pixel_width(w) && !video->pixel_height(h)) {
          std::cout << " " << w << "x" << h;
        }
      }
      if (const auto audio = entry.audio()) {
        double rate = 0.0;
        std::uint64_t channels = 0;
        if (!audio->sampling_frequency(rate) && !audio->channels(channels)) {
          std::cout << " " << rate << "Hz x" << channels;
        }
      }
      std::optional<std::string> language;
      if (!entry.language(language) && language) {
        std::cout << " [" << *language << "]";
      }
      std::cout << "\n";
    }
  }
}

void print_failure(const std::error_code &ec, const tree::ParseFailure &failure) {
  std::cerr << "parse failed: " << ec.message() << " (stage=" << tree::stage_name(failure.stage)
            << ", offset=" << failure.offset;
  if (failure.element_id) {
    std::cerr << ", id=0x" << std::hex << std::uppercase << *failure.element_id << std::dec;
  }
  std::cerr << ")\n";
}

}  // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 2;
  }

  std::optional<std::string_view> path;
  std::optional<std::string_view> hex;
  utils::NodeDumpOptions dump_options;
  core::set_log_level(core::LogLevel::warn);

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--hex" && i + 1 < argc) {
      hex = argv[++i];
    } else if (arg == "--depth" && i + 1 < argc) {
      dump_options.max_depth = static_cast<std::size_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (arg == "--color") {
      dump_options.enable_color = true;
    } else if (arg == "--log-level" && i + 1 < argc) {
      core::LogLevel level{};
      if (auto ec = core::parse_log_level(argv[++i], level)) {
        std::cerr << "bad --log-level: " << ec.message() << "\n";
        return 2;
      }
      core::set_log_level(level);
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (!arg.empty() && arg[0] != '-') {
      path = arg;
    } else {
      print_usage(argv[0]);
      return 2;
    }
  }

  tree::ParseFailure failure;
  tree::Document doc;

  if (hex) {
    std::vector<core::byte> bytes;
    if (auto ec = utils::parse_hex(*hex, bytes)) {
      std::cerr << "bad hex input: " << ec.message() << "\n";
      return 2;
    }
    auto [ec, parsed] =
      utils::parse_document_bytes(core::bytes_view{bytes.data(), bytes.size()}, {}, &failure);
    if (ec) {
      print_failure(ec, failure);
      std::cerr << utils::hex_dump(core::bytes_view{bytes.data(), bytes.size()});
      return 1;
    }
    doc = std::move(parsed);
  } else if (path) {
    std::ifstream in{std::string(*path), std::ios::binary};
    if (!in) {
      std::cerr << "cannot open " << *path << "\n";
      return 1;
    }
    auto [ec, parsed] = utils::parse_document_stream(in, {}, &failure);
    if (ec) {
      print_failure(ec, failure);
      return 1;
    }
    doc = std::move(parsed);
  } else {
    print_usage(argv[0]);
    return 2;
  }

  std::cout << utils::dump_document(doc, dump_options) << "\n";
  print_track_summary(doc);
  return 0;
}
