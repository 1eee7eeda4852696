#pragma once

#include "ebml/core/common.hpp"
#include "ebml/schema/chapters.hpp"
#include "ebml/schema/cluster.hpp"
#include "ebml/schema/cues.hpp"
#include "ebml/schema/ids.hpp"
#include "ebml/schema/tags.hpp"
#include "ebml/schema/tracks.hpp"
#include "ebml/schema/view.hpp"
#include "ebml/tree/document.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ebml::schema {

/**
 * @brief EBML 头（文档第一个顶层元素）：所有字段均为必选。
 */
class EBMLHeader final : public ElementView<EBMLHeader, id::kEBML> {
 public:
  using ElementView::ElementView;

  std::error_code version(std::uint64_t& out) const { return required_field(id::kEBMLVersion, out); }
  std::error_code read_version(std::uint64_t& out) const { return required_field(id::kEBMLReadVersion, out); }
  std::error_code max_id_length(std::uint64_t& out) const { return required_field(id::kEBMLMaxIDLength, out); }
  std::error_code max_size_length(std::uint64_t& out) const {
    return required_field(id::kEBMLMaxSizeLength, out);
  }

  // "webm" / "matroska"
  std::error_code doc_type(std::string& out) const { return required_field(id::kDocType, out); }

  std::error_code doc_type_version(std::uint64_t& out) const { return required_field(id::kDocTypeVersion, out); }
  std::error_code doc_type_read_version(std::uint64_t& out) const {
    return required_field(id::kDocTypeReadVersion, out);
  }
};

class Seek final : public ElementView<Seek, id::kSeek> {
 public:
  using ElementView::ElementView;

  // 被索引元素 ID 的原始字节。
  std::error_code seek_id(core::bytes_view& out) const { return required_field(id::kSeekID, out); }

  std::error_code seek_position(std::uint64_t& out) const { return required_field(id::kSeekPosition, out); }
};

class SeekHead final : public ElementView<SeekHead, id::kSeekHead> {
 public:
  using ElementView::ElementView;

  [[nodiscard]] std::vector<Seek> seeks() const { return child_views<Seek>(); }
};

class Info final : public ElementView<Info, id::kInfo> {
 public:
  using ElementView::ElementView;

  // 时间戳单位（纳秒），默认文件为 1000000。
  std::error_code timestamp_scale(std::uint64_t& out) const { return required_field(id::kTimestampScale, out); }

  std::error_code duration(std::optional<double>& out) const { return optional_field(id::kDuration, out); }

  // 相对 2001-01-01T00:00:00 UTC 的纳秒数。
  std::error_code date_created(std::optional<std::int64_t>& out) const {
    return optional_field(id::kDateUTC, out);
  }

  std::error_code muxing_app(std::string& out) const { return required_field(id::kMuxingApp, out); }
  std::error_code writing_app(std::string& out) const { return required_field(id::kWritingApp, out); }

  std::error_code title(std::optional<std::string>& out) const { return optional_field(id::kTitle, out); }

  std::error_code segment_uid(std::optional<core::bytes_view>& out) const {
    return optional_field(id::kSegmentUID, out);
  }
};

class SignatureElementList final : public ElementView<SignatureElementList, id::kSignatureElementList> {
 public:
  using ElementView::ElementView;

  std::error_code signed_elements(std::vector<core::bytes_view>& out) const {
    return repeated_field(id::kSignedElement, out);
  }
};

class SignatureElements final : public ElementView<SignatureElements, id::kSignatureElements> {
 public:
  using ElementView::ElementView;

  [[nodiscard]] std::vector<SignatureElementList> element_lists() const {
    return child_views<SignatureElementList>();
  }
};

class SignatureSlot final : public ElementView<SignatureSlot, id::kSignatureSlot> {
 public:
  using ElementView::ElementView;

  std::error_code algo(std::optional<std::uint64_t>& out) const { return optional_field(id::kSignatureAlgo, out); }
  std::error_code hash(std::optional<std::uint64_t>& out) const { return optional_field(id::kSignatureHash, out); }

  std::error_code public_key(std::optional<core::bytes_view>& out) const {
    return optional_field(id::kSignaturePublicKey, out);
  }

  std::error_code signature(std::optional<core::bytes_view>& out) const {
    return optional_field(id::kSignature, out);
  }

  [[nodiscard]] std::optional<SignatureElements> signature_elements() const {
    return optional_child<SignatureElements>();
  }
};

/**
 * @brief Segment：所有顶层分区均按重复子节点暴露（文档顺序）。
 */
class Segment final : public ElementView<Segment, id::kSegment> {
 public:
  using ElementView::ElementView;

  [[nodiscard]] std::vector<SeekHead> seek_heads() const { return child_views<SeekHead>(); }
  [[nodiscard]] std::vector<Info> infos() const { return child_views<Info>(); }
  [[nodiscard]] std::vector<Cluster> clusters() const { return child_views<Cluster>(); }
  [[nodiscard]] std::vector<Tracks> tracks() const { return child_views<Tracks>(); }
  [[nodiscard]] std::vector<Cues> cues() const { return child_views<Cues>(); }
  [[nodiscard]] std::vector<Chapters> chapters() const { return child_views<Chapters>(); }
  [[nodiscard]] std::vector<Tags> tags() const { return child_views<Tags>(); }
  [[nodiscard]] std::vector<SignatureSlot> signature_slots() const { return child_views<SignatureSlot>(); }
};

/**
 * @brief Document 的两个入口视图。
 *
 * header 的 ID 已由签名校验保证；root 不校验 ID，直接按 Segment 解释。
 */
[[nodiscard]] inline EBMLHeader header_of(const tree::Document& doc) noexcept {
  return EBMLHeader(doc.header());
}

[[nodiscard]] inline Segment segment_of(const tree::Document& doc) noexcept {
  return Segment(doc.root());
}

}  // namespace ebml::schema
