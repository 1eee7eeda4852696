#pragma once

#include "ebml/core/common.hpp"
#include "ebml/schema/ids.hpp"
#include "ebml/schema/view.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ebml::schema {

class ContentEncAESSettings final : public ElementView<ContentEncAESSettings, id::kContentEncAESSettings> {
 public:
  using ElementView::ElementView;

  std::error_code cipher_mode(std::uint64_t& out) const {
    return required_field(id::kAESSettingsCipherMode, out);
  }
};

class ContentEncryption final : public ElementView<ContentEncryption, id::kContentEncryption> {
 public:
  using ElementView::ElementView;

  std::error_code algorithm(std::uint64_t& out) const { return required_field(id::kContentEncAlgo, out); }

  std::error_code key_id(std::optional<core::bytes_view>& out) const {
    return optional_field(id::kContentEncKeyID, out);
  }

  [[nodiscard]] std::optional<ContentEncAESSettings> aes_settings() const {
    return optional_child<ContentEncAESSettings>();
  }
};

class ContentEncoding final : public ElementView<ContentEncoding, id::kContentEncoding> {
 public:
  using ElementView::ElementView;

  std::error_code order(std::uint64_t& out) const { return required_field(id::kContentEncodingOrder, out); }
  std::error_code scope(std::uint64_t& out) const { return required_field(id::kContentEncodingScope, out); }
  std::error_code type(std::uint64_t& out) const { return required_field(id::kContentEncodingType, out); }

  std::error_code encryption(ContentEncryption& out) const { return required_child(out); }
};

class ContentEncodings final : public ElementView<ContentEncodings, id::kContentEncodings> {
 public:
  using ElementView::ElementView;

  [[nodiscard]] std::vector<ContentEncoding> content_encodings() const {
    return child_views<ContentEncoding>();
  }
};

class Projection final : public ElementView<Projection, id::kProjection> {
 public:
  using ElementView::ElementView;

  std::error_code projection_type(std::uint64_t& out) const {
    return required_field(id::kProjectionType, out);
  }

  std::error_code projection_private(std::optional<core::bytes_view>& out) const {
    return optional_field(id::kProjectionPrivate, out);
  }

  std::error_code pose_yaw(double& out) const { return required_field(id::kProjectionPoseYaw, out); }
  std::error_code pose_pitch(double& out) const { return required_field(id::kProjectionPosePitch, out); }
  std::error_code pose_roll(double& out) const { return required_field(id::kProjectionPoseRoll, out); }
};

class Video final : public ElementView<Video, id::kVideo> {
 public:
  using ElementView::ElementView;

  std::error_code flag_interlaced(std::uint64_t& out) const {
    return required_field(id::kFlagInterlaced, out);
  }

  std::error_code stereo_mode(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kStereoMode, out);
  }

  std::error_code alpha_mode(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kAlphaMode, out);
  }

  std::error_code pixel_width(std::uint64_t& out) const { return required_field(id::kPixelWidth, out); }
  std::error_code pixel_height(std::uint64_t& out) const { return required_field(id::kPixelHeight, out); }

  std::error_code pixel_crop_bottom(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kPixelCropBottom, out);
  }
  std::error_code pixel_crop_top(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kPixelCropTop, out);
  }
  std::error_code pixel_crop_left(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kPixelCropLeft, out);
  }
  std::error_code pixel_crop_right(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kPixelCropRight, out);
  }

  std::error_code display_width(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kDisplayWidth, out);
  }
  std::error_code display_height(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kDisplayHeight, out);
  }
  std::error_code display_unit(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kDisplayUnit, out);
  }
  std::error_code aspect_ratio_type(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kAspectRatioType, out);
  }

  [[nodiscard]] std::optional<Projection> projection() const { return optional_child<Projection>(); }
};

class Audio final : public ElementView<Audio, id::kAudio> {
 public:
  using ElementView::ElementView;

  std::error_code sampling_frequency(double& out) const {
    return required_field(id::kSamplingFrequency, out);
  }

  std::error_code output_sampling_frequency(std::optional<double>& out) const {
    return optional_field(id::kOutputSamplingFrequency, out);
  }

  std::error_code channels(std::uint64_t& out) const { return required_field(id::kChannels, out); }

  std::error_code bit_depth(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kBitDepth, out);
  }
};

/**
 * @brief 单条轨道描述。
 *
 * flag_* 为布尔字段：仅当存储值恰好为 1 时为 true。
 */
class TrackEntry final : public ElementView<TrackEntry, id::kTrackEntry> {
 public:
  using ElementView::ElementView;

  std::error_code track_number(std::uint64_t& out) const { return required_field(id::kTrackNumber, out); }
  std::error_code track_uid(std::uint64_t& out) const { return required_field(id::kTrackUID, out); }

  // 1=video 2=audio 3=complex 0x10=logo 0x11=subtitle 0x12=buttons 0x20=control
  std::error_code track_type(std::uint64_t& out) const { return required_field(id::kTrackType, out); }

  std::error_code flag_enabled(bool& out) const { return required_field(id::kFlagEnabled, out); }
  std::error_code flag_default(bool& out) const { return required_field(id::kFlagDefault, out); }
  std::error_code flag_forced(bool& out) const { return required_field(id::kFlagForced, out); }
  std::error_code flag_lacing(bool& out) const { return required_field(id::kFlagLacing, out); }

  std::error_code default_duration(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kDefaultDuration, out);
  }

  std::error_code track_timestamp_scale(std::optional<double>& out) const {
    return optional_field(id::kTrackTimestampScale, out);
  }

  std::error_code name(std::optional<std::string>& out) const { return optional_field(id::kName, out); }
  std::error_code language(std::optional<std::string>& out) const {
    return optional_field(id::kLanguage, out);
  }

  std::error_code codec_id(std::string& out) const { return required_field(id::kCodecID, out); }

  std::error_code codec_private(std::optional<core::bytes_view>& out) const {
    return optional_field(id::kCodecPrivate, out);
  }

  std::error_code codec_name(std::optional<std::string>& out) const {
    return optional_field(id::kCodecName, out);
  }

  std::error_code codec_delay(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kCodecDelay, out);
  }

  std::error_code seek_pre_roll(std::uint64_t& out) const { return required_field(id::kSeekPreRoll, out); }

  [[nodiscard]] std::optional<Video> video() const { return optional_child<Video>(); }
  [[nodiscard]] std::optional<Audio> audio() const { return optional_child<Audio>(); }

  [[nodiscard]] std::optional<ContentEncodings> content_encodings() const {
    return optional_child<ContentEncodings>();
  }
};

class Tracks final : public ElementView<Tracks, id::kTracks> {
 public:
  using ElementView::ElementView;

  [[nodiscard]] std::vector<TrackEntry> track_entries() const { return child_views<TrackEntry>(); }
};

}  // namespace ebml::schema
