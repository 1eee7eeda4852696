#pragma once

#include "ebml/core/common.hpp"
#include "ebml/schema/ids.hpp"
#include "ebml/schema/view.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace ebml::schema {

class TimeSlice final : public ElementView<TimeSlice, id::kTimeSlice> {
 public:
  using ElementView::ElementView;

  std::error_code lace_number(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kLaceNumber, out);
  }
};

class Slices final : public ElementView<Slices, id::kSlices> {
 public:
  using ElementView::ElementView;

  [[nodiscard]] std::vector<TimeSlice> time_slices() const { return child_views<TimeSlice>(); }
};

class BlockGroup final : public ElementView<BlockGroup, id::kBlockGroup> {
 public:
  using ElementView::ElementView;

  // 原始 Block 字节（头部可用 parse_block_header 解出）。
  std::error_code block(core::bytes_view& out) const { return required_field(id::kBlock, out); }

  std::error_code block_duration(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kBlockDuration, out);
  }

  // 相对当前块的时间戳偏移（可为负）。
  std::error_code reference_blocks(std::vector<std::int64_t>& out) const {
    return repeated_field(id::kReferenceBlock, out);
  }

  std::error_code discard_padding(std::optional<std::int64_t>& out) const {
    return optional_field(id::kDiscardPadding, out);
  }

  [[nodiscard]] std::optional<Slices> slices() const { return optional_child<Slices>(); }
};

class Cluster final : public ElementView<Cluster, id::kCluster> {
 public:
  using ElementView::ElementView;

  std::error_code timestamp(std::uint64_t& out) const { return required_field(id::kTimestamp, out); }

  std::error_code prev_size(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kPrevSize, out);
  }

  std::error_code position(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kPosition, out);
  }

  std::error_code simple_blocks(std::vector<core::bytes_view>& out) const {
    return repeated_field(id::kSimpleBlock, out);
  }

  [[nodiscard]] std::vector<BlockGroup> block_groups() const { return child_views<BlockGroup>(); }
};

/**
 * @brief Block/SimpleBlock 的 lacing 方式（flags bit 1-2）。
 */
enum class Lacing : std::uint8_t {
  none = 0,
  xiph = 1,
  fixed_size = 2,
  ebml = 3,
};

[[nodiscard]] std::string_view lacing_name(Lacing lacing) noexcept;

/**
 * @brief Block/SimpleBlock 头部：
 *
 *   [TrackNumber: vint] [Timecode: int16 BE] [Flags: 1B] [帧数据...]
 *
 * flags 按 SimpleBlock 语义解释；对 BlockGroup 内的 Block，
 * keyframe/discardable 位是保留位，调用方应忽略。
 */
struct BlockHeader final {
  std::uint64_t track_number{0};

  // 相对所属 Cluster 时间戳的偏移。
  std::int16_t relative_timestamp{0};

  bool keyframe{false};
  bool invisible{false};
  Lacing lacing{Lacing::none};
  bool discardable{false};

  // 头部字节数（帧数据从此偏移开始）。
  std::size_t header_size{0};
};

/**
 * @brief 解析 Block/SimpleBlock payload 的头部；不解析 lacing 与帧数据。
 *
 * 不足 track vint + 3 字节时返回 codec::errc::truncated。
 */
std::error_code parse_block_header(core::bytes_view payload, BlockHeader& out) noexcept;

}  // namespace ebml::schema
