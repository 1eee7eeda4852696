#include "ebml/schema/cluster.hpp"

#include "ebml/codec/primitive.hpp"

namespace ebml::schema {

std::string_view lacing_name(Lacing lacing) noexcept {
  switch (lacing) {
    case Lacing::none:
      return "none";
    case Lacing::xiph:
      return "xiph";
    case Lacing::fixed_size:
      return "fixed";
    case Lacing::ebml:
      return "ebml";
  }
  return "none";
}

std::error_code parse_block_header(core::bytes_view payload, BlockHeader& out) noexcept {
  std::uint64_t track = 0;
  std::size_t track_len = 0;
  auto ec = codec::decode_vint(payload, track, track_len);
  if (ec) {
    return ec;
  }
  if (payload.size() < track_len + 3) {
    return codec::make_error_code(codec::errc::truncated);
  }

  const auto* p = payload.data() + track_len;
  const auto raw = static_cast<std::uint16_t>((static_cast<std::uint16_t>(p[0]) << 8u) | p[1]);
  const auto flags = p[2];

  BlockHeader header;
  header.track_number = track;
  header.relative_timestamp = static_cast<std::int16_t>(raw);
  header.keyframe = (flags & 0x80u) != 0;
  header.invisible = (flags & 0x08u) != 0;
  header.lacing = static_cast<Lacing>((flags >> 1u) & 0x03u);
  header.discardable = (flags & 0x01u) != 0;
  header.header_size = track_len + 3;

  out = header;
  return {};
}

}  // namespace ebml::schema
