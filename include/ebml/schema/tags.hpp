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

class Targets final : public ElementView<Targets, id::kTargets> {
 public:
  using ElementView::ElementView;

  std::error_code type_value(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kTargetTypeValue, out);
  }

  std::error_code type(std::optional<std::string>& out) const { return optional_field(id::kTargetType, out); }

  std::error_code track_uids(std::vector<std::uint64_t>& out) const {
    return repeated_field(id::kTagTrackUID, out);
  }
};

class SimpleTag final : public ElementView<SimpleTag, id::kSimpleTag> {
 public:
  using ElementView::ElementView;

  std::error_code name(std::string& out) const { return required_field(id::kTagName, out); }
  std::error_code language(std::string& out) const { return required_field(id::kTagLanguage, out); }
  std::error_code tag_default(std::uint64_t& out) const { return required_field(id::kTagDefault, out); }

  std::error_code string(std::optional<std::string>& out) const {
    return optional_field(id::kTagString, out);
  }

  std::error_code binary(std::optional<core::bytes_view>& out) const {
    return optional_field(id::kTagBinary, out);
  }

  [[nodiscard]] std::vector<SimpleTag> simple_tags() const { return child_views<SimpleTag>(); }
};

class Tag final : public ElementView<Tag, id::kTag> {
 public:
  using ElementView::ElementView;

  std::error_code targets(Targets& out) const { return required_child(out); }

  [[nodiscard]] std::vector<SimpleTag> simple_tags() const { return child_views<SimpleTag>(); }
};

class Tags final : public ElementView<Tags, id::kTags> {
 public:
  using ElementView::ElementView;

  [[nodiscard]] std::vector<Tag> tags() const { return child_views<Tag>(); }
};

}  // namespace ebml::schema
