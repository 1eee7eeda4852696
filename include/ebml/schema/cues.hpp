#pragma once

#include "ebml/schema/ids.hpp"
#include "ebml/schema/view.hpp"

#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace ebml::schema {

class CueTrackPositions final : public ElementView<CueTrackPositions, id::kCueTrackPositions> {
 public:
  using ElementView::ElementView;

  std::error_code track(std::uint64_t& out) const { return required_field(id::kCueTrack, out); }

  // 相对 Segment payload 起点的 Cluster 偏移。
  std::error_code cluster_position(std::uint64_t& out) const {
    return required_field(id::kCueClusterPosition, out);
  }

  std::error_code block_number(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kCueBlockNumber, out);
  }
};

class CuePoint final : public ElementView<CuePoint, id::kCuePoint> {
 public:
  using ElementView::ElementView;

  std::error_code time(std::uint64_t& out) const { return required_field(id::kCueTime, out); }

  [[nodiscard]] std::vector<CueTrackPositions> track_positions() const {
    return child_views<CueTrackPositions>();
  }
};

class Cues final : public ElementView<Cues, id::kCues> {
 public:
  using ElementView::ElementView;

  [[nodiscard]] std::vector<CuePoint> cue_points() const { return child_views<CuePoint>(); }
};

}  // namespace ebml::schema
