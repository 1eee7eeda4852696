#pragma once

#include "ebml/schema/ids.hpp"
#include "ebml/schema/view.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ebml::schema {

class ChapterDisplay final : public ElementView<ChapterDisplay, id::kChapterDisplay> {
 public:
  using ElementView::ElementView;

  std::error_code string(std::string& out) const { return required_field(id::kChapString, out); }

  std::error_code languages(std::vector<std::string>& out) const {
    return repeated_field(id::kChapLanguage, out);
  }
};

// 章节可嵌套：chapter_atoms() 返回子章节。
class ChapterAtom final : public ElementView<ChapterAtom, id::kChapterAtom> {
 public:
  using ElementView::ElementView;

  std::error_code uid(std::uint64_t& out) const { return required_field(id::kChapterUID, out); }

  std::error_code string_uid(std::optional<std::string>& out) const {
    return optional_field(id::kChapterStringUID, out);
  }

  std::error_code time_start(std::uint64_t& out) const { return required_field(id::kChapterTimeStart, out); }

  std::error_code time_end(std::optional<std::uint64_t>& out) const {
    return optional_field(id::kChapterTimeEnd, out);
  }

  [[nodiscard]] std::vector<ChapterDisplay> displays() const { return child_views<ChapterDisplay>(); }
  [[nodiscard]] std::vector<ChapterAtom> chapter_atoms() const { return child_views<ChapterAtom>(); }
};

class EditionEntry final : public ElementView<EditionEntry, id::kEditionEntry> {
 public:
  using ElementView::ElementView;

  [[nodiscard]] std::vector<ChapterAtom> chapter_atoms() const { return child_views<ChapterAtom>(); }
};

class Chapters final : public ElementView<Chapters, id::kChapters> {
 public:
  using ElementView::ElementView;

  [[nodiscard]] std::vector<EditionEntry> edition_entries() const { return child_views<EditionEntry>(); }
};

}  // namespace ebml::schema
