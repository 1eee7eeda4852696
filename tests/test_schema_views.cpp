#include "ebml/core/log.hpp"
#include "ebml/schema/schema.hpp"
#include "ebml/utils/parse_helpers.hpp"

#include "ebml_builder.hpp"
#include "test_main.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace id = ebml::schema::id;
using ebml::schema::errc;
using ebml::tests::bytes;
using ebml::tests::element;
using ebml::tests::float32_element;
using ebml::tests::int_element;
using ebml::tests::master;
using ebml::tests::string_element;
using ebml::tests::uint_element;
using ebml::tests::view;
using ebml::tree::Node;

Node build_ok(const bytes& data) {
  auto [ec, result] = ebml::utils::build_tree_bytes(view(data));
  TEST_EXPECT_OK(ec);
  TEST_EXPECT(result.fully_consumed);
  return std::move(result.node);
}

void test_mandatory_field_missing() {
  const auto node = build_ok(master(id::kInfo, {string_element(id::kMuxingApp, "m")}));
  ebml::schema::Info info;
  TEST_EXPECT_OK(ebml::schema::Info::from(node, info));

  std::uint64_t scale = 42;
  TEST_EXPECT_ERR(info.timestamp_scale(scale), errc::missing_field);
  // 失败时 out 不变。
  TEST_EXPECT_EQ(scale, 42u);

  std::string muxing;
  TEST_EXPECT_OK(info.muxing_app(muxing));
  TEST_EXPECT_EQ(muxing, "m");

  std::string writing;
  TEST_EXPECT_ERR(info.writing_app(writing), errc::missing_field);
}

void test_optional_fields() {
  const auto node = build_ok(master(id::kInfo,
                                    {
                                      string_element(id::kTitle, "clip"),
                                      int_element(id::kDateUTC, -1000),
                                    }));
  const ebml::schema::Info info(node);

  std::optional<std::string> title;
  TEST_EXPECT_OK(info.title(title));
  TEST_EXPECT_EQ(title.value_or(""), "clip");

  std::optional<std::int64_t> date;
  TEST_EXPECT_OK(info.date_created(date));
  TEST_EXPECT_EQ(date.value_or(0), -1000);

  std::optional<ebml::core::bytes_view> uid{ebml::core::bytes_view{}};
  TEST_EXPECT_OK(info.segment_uid(uid));
  TEST_EXPECT(!uid.has_value());
}

void test_repeated_fields_in_document_order() {
  const auto node = build_ok(master(id::kBlockGroup,
                                    {
                                      element(id::kBlock, bytes{0x81, 0x00, 0x00, 0x00}),
                                      int_element(id::kReferenceBlock, -40),
                                      uint_element(id::kBlockDuration, 20),
                                      int_element(id::kReferenceBlock, 20),
                                      int_element(id::kDiscardPadding, -5),
                                    }));
  const ebml::schema::BlockGroup group(node);

  std::vector<std::int64_t> refs;
  TEST_EXPECT_OK(group.reference_blocks(refs));
  TEST_EXPECT_EQ(refs, (std::vector<std::int64_t>{-40, 20}));

  std::optional<std::uint64_t> duration;
  TEST_EXPECT_OK(group.block_duration(duration));
  TEST_EXPECT_EQ(duration.value_or(0), 20u);

  std::optional<std::int64_t> padding;
  TEST_EXPECT_OK(group.discard_padding(padding));
  TEST_EXPECT_EQ(padding.value_or(0), -5);

  ebml::core::bytes_view block;
  TEST_EXPECT_OK(group.block(block));
  TEST_EXPECT_EQ(block.size(), 4u);
  TEST_EXPECT(!group.slices().has_value());

  // 无匹配子节点时返回空序列。
  const auto empty = build_ok(master(id::kBlockGroup, {}));
  refs.push_back(1);
  TEST_EXPECT_OK(ebml::schema::BlockGroup(empty).reference_blocks(refs));
  TEST_EXPECT(refs.empty());
}

void test_first_match_wins() {
  const auto node = build_ok(master(id::kCuePoint,
                                    {
                                      uint_element(id::kCueTime, 7),
                                      uint_element(id::kCueTime, 9),
                                    }));
  std::uint64_t time = 0;
  TEST_EXPECT_OK(ebml::schema::CuePoint(node).time(time));
  TEST_EXPECT_EQ(time, 7u);
}

void test_boolean_exactly_one() {
  const auto make_entry = [](std::uint64_t flag_value) {
    return master(id::kTrackEntry, {uint_element(id::kFlagEnabled, flag_value)});
  };

  bool flag = false;
  const auto one = build_ok(make_entry(1));
  TEST_EXPECT_OK(ebml::schema::TrackEntry(one).flag_enabled(flag));
  TEST_EXPECT(flag);

  for (std::uint64_t v : {std::uint64_t{0}, std::uint64_t{2}, std::uint64_t{0xFF}}) {
    flag = true;
    const auto node = build_ok(make_entry(v));
    TEST_EXPECT_OK(ebml::schema::TrackEntry(node).flag_enabled(flag));
    TEST_EXPECT(!flag);
  }

  flag = true;
  const auto missing = build_ok(master(id::kTrackEntry, {}));
  TEST_EXPECT_ERR(ebml::schema::TrackEntry(missing).flag_default(flag), errc::missing_field);
}

void test_sub_views() {
  const auto node = build_ok(master(
    id::kContentEncodings,
    {master(id::kContentEncoding,
            {
              uint_element(id::kContentEncodingOrder, 0),
              uint_element(id::kContentEncodingScope, 1),
              uint_element(id::kContentEncodingType, 1),
              master(id::kContentEncryption,
                     {
                       uint_element(id::kContentEncAlgo, 5),
                       element(id::kContentEncKeyID, bytes{0x01, 0x02}),
                       master(id::kContentEncAESSettings, {uint_element(id::kAESSettingsCipherMode, 1)}),
                     }),
            })}));

  const ebml::schema::ContentEncodings encodings(node);
  const auto list = encodings.content_encodings();
  TEST_EXPECT_EQ(list.size(), 1u);
  if (list.empty()) {
    return;
  }

  ebml::schema::ContentEncryption encryption;
  TEST_EXPECT(!encryption.valid());
  TEST_EXPECT_OK(list[0].encryption(encryption));
  TEST_EXPECT(encryption.valid());
  TEST_EXPECT_EQ(encryption.id(), id::kContentEncryption);

  std::uint64_t algo = 0;
  TEST_EXPECT_OK(encryption.algorithm(algo));
  TEST_EXPECT_EQ(algo, 5u);

  std::optional<ebml::core::bytes_view> key;
  TEST_EXPECT_OK(encryption.key_id(key));
  TEST_EXPECT(key.has_value() && key->size() == 2);

  const auto aes = encryption.aes_settings();
  TEST_EXPECT(aes.has_value());
  std::uint64_t mode = 0;
  if (aes) {
    TEST_EXPECT_OK(aes->cipher_mode(mode));
  }
  TEST_EXPECT_EQ(mode, 1u);

  // 缺失的必选子视图。
  const auto bare = build_ok(master(id::kContentEncoding, {}));
  TEST_EXPECT_ERR(ebml::schema::ContentEncoding(bare).encryption(encryption), errc::missing_field);
}

void test_from_checks_id() {
  const auto node = build_ok(master(id::kTracks, {}));

  ebml::schema::Tracks tracks;
  TEST_EXPECT_OK(ebml::schema::Tracks::from(node, tracks));
  TEST_EXPECT(tracks.valid());

  ebml::schema::Cues cues;
  TEST_EXPECT_ERR(ebml::schema::Cues::from(node, cues), errc::wrong_element);
  TEST_EXPECT(!cues.valid());
}

void test_default_view_reports_missing() {
  const ebml::schema::Info info;
  std::uint64_t scale = 0;
  TEST_EXPECT_ERR(info.timestamp_scale(scale), errc::missing_field);
  std::optional<std::string> title;
  TEST_EXPECT_OK(info.title(title));
  TEST_EXPECT(!title.has_value());
  TEST_EXPECT_EQ(info.id(), 0u);
}

void test_decode_errors_propagate() {
  // 非法 UTF-8 与超长整数 payload 在访问时报告，而不是在解析时。
  const auto node = build_ok(master(id::kTrackEntry,
                                    {
                                      element(id::kCodecID, bytes{0xFF, 0xFE}),
                                      element(id::kTrackNumber, bytes(9, 0x01)),
                                    }));
  const ebml::schema::TrackEntry entry(node);

  std::string codec;
  TEST_EXPECT_ERR(entry.codec_id(codec), ebml::codec::errc::invalid_utf8);

  std::uint64_t number = 0;
  TEST_EXPECT_ERR(entry.track_number(number), ebml::codec::errc::invalid_length);
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void test_field_errors_logged_with_ids() {
  std::ostringstream captured;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
  sink->set_pattern("%v");
  auto logger = std::make_shared<spdlog::logger>("ebml-views", sink);
  logger->set_level(spdlog::level::debug);
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(logger);
  ebml::core::set_log_level(ebml::core::LogLevel::debug);

  const auto track_node = build_ok(master(id::kTrackEntry, {element(id::kCodecID, bytes{0xFF, 0xFE})}));
  std::string codec;
  TEST_EXPECT_ERR(ebml::schema::TrackEntry(track_node).codec_id(codec), ebml::codec::errc::invalid_utf8);
  TEST_EXPECT(contains(captured.str(), "parent=0xAE (TrackEntry) field=0x86 (CodecID)"));

  const auto info_node = build_ok(master(id::kInfo, {}));
  std::uint64_t scale = 0;
  TEST_EXPECT_ERR(ebml::schema::Info(info_node).timestamp_scale(scale), errc::missing_field);
  TEST_EXPECT(contains(captured.str(),
                       "parent=0x1549A966 (Info) field=0x2AD7B1 (TimestampScale): mandatory field missing"));

  // optional 字段缺失不是错误，不写日志。
  const auto before = captured.str().size();
  std::optional<std::string> title;
  TEST_EXPECT_OK(ebml::schema::Info(info_node).title(title));
  TEST_EXPECT_EQ(captured.str().size(), before);

  spdlog::set_default_logger(previous);
  ebml::core::set_log_level(ebml::core::LogLevel::off);
}

void test_chapters_and_tags() {
  const auto chapters_node = build_ok(master(
    id::kChapters,
    {master(id::kEditionEntry,
            {master(id::kChapterAtom,
                    {
                      uint_element(id::kChapterUID, 11),
                      uint_element(id::kChapterTimeStart, 0),
                      master(id::kChapterDisplay,
                             {
                               string_element(id::kChapString, "Intro"),
                               string_element(id::kChapLanguage, "eng"),
                               string_element(id::kChapLanguage, "ger"),
                             }),
                      master(id::kChapterAtom,
                             {uint_element(id::kChapterUID, 12), uint_element(id::kChapterTimeStart, 500)}),
                    })})}));

  const auto editions = ebml::schema::Chapters(chapters_node).edition_entries();
  TEST_EXPECT_EQ(editions.size(), 1u);
  if (!editions.empty()) {
    const auto atoms = editions[0].chapter_atoms();
    TEST_EXPECT_EQ(atoms.size(), 1u);
    if (!atoms.empty()) {
      const auto displays = atoms[0].displays();
      TEST_EXPECT_EQ(displays.size(), 1u);
      if (!displays.empty()) {
        std::string text;
        std::vector<std::string> languages;
        TEST_EXPECT_OK(displays[0].string(text));
        TEST_EXPECT_OK(displays[0].languages(languages));
        TEST_EXPECT_EQ(text, "Intro");
        TEST_EXPECT_EQ(languages, (std::vector<std::string>{"eng", "ger"}));
      }
      const auto nested = atoms[0].chapter_atoms();
      TEST_EXPECT_EQ(nested.size(), 1u);
      std::uint64_t start = 0;
      if (!nested.empty()) {
        TEST_EXPECT_OK(nested[0].time_start(start));
      }
      TEST_EXPECT_EQ(start, 500u);

      std::optional<std::uint64_t> end;
      TEST_EXPECT_OK(atoms[0].time_end(end));
      TEST_EXPECT(!end.has_value());
    }
  }

  const auto tags_node = build_ok(master(
    id::kTags,
    {master(id::kTag,
            {
              master(id::kTargets, {uint_element(id::kTargetTypeValue, 50), uint_element(id::kTagTrackUID, 1)}),
              master(id::kSimpleTag,
                     {
                       string_element(id::kTagName, "TITLE"),
                       string_element(id::kTagLanguage, "und"),
                       uint_element(id::kTagDefault, 1),
                       string_element(id::kTagString, "Demo"),
                     }),
            })}));

  const auto tags = ebml::schema::Tags(tags_node).tags();
  TEST_EXPECT_EQ(tags.size(), 1u);
  if (!tags.empty()) {
    ebml::schema::Targets targets;
    TEST_EXPECT_OK(tags[0].targets(targets));
    std::optional<std::uint64_t> type_value;
    std::vector<std::uint64_t> uids;
    TEST_EXPECT_OK(targets.type_value(type_value));
    TEST_EXPECT_OK(targets.track_uids(uids));
    TEST_EXPECT_EQ(type_value.value_or(0), 50u);
    TEST_EXPECT_EQ(uids, (std::vector<std::uint64_t>{1}));

    const auto simple = tags[0].simple_tags();
    TEST_EXPECT_EQ(simple.size(), 1u);
    if (!simple.empty()) {
      std::string name;
      std::optional<std::string> value;
      std::uint64_t is_default = 0;
      TEST_EXPECT_OK(simple[0].name(name));
      TEST_EXPECT_OK(simple[0].string(value));
      TEST_EXPECT_OK(simple[0].tag_default(is_default));
      TEST_EXPECT_EQ(name, "TITLE");
      TEST_EXPECT_EQ(value.value_or(""), "Demo");
      TEST_EXPECT_EQ(is_default, 1u);
      TEST_EXPECT(simple[0].simple_tags().empty());
    }
  }
}

void test_projection_and_signature_views() {
  const auto video_node = build_ok(master(
    id::kVideo,
    {
      uint_element(id::kFlagInterlaced, 0),
      uint_element(id::kPixelWidth, 3840),
      uint_element(id::kPixelHeight, 1920),
      uint_element(id::kPixelCropTop, 8),
      master(id::kProjection,
             {
               uint_element(id::kProjectionType, 1),
               float32_element(id::kProjectionPoseYaw, 12.5f),
               float32_element(id::kProjectionPosePitch, 0.0f),
               float32_element(id::kProjectionPoseRoll, -90.0f),
             }),
    }));
  const ebml::schema::Video video(video_node);

  std::optional<std::uint64_t> crop_top;
  std::optional<std::uint64_t> crop_bottom;
  TEST_EXPECT_OK(video.pixel_crop_top(crop_top));
  TEST_EXPECT_OK(video.pixel_crop_bottom(crop_bottom));
  TEST_EXPECT_EQ(crop_top.value_or(0), 8u);
  TEST_EXPECT(!crop_bottom.has_value());

  const auto projection = video.projection();
  TEST_EXPECT(projection.has_value());
  if (projection) {
    double yaw = 0.0;
    double roll = 0.0;
    TEST_EXPECT_OK(projection->pose_yaw(yaw));
    TEST_EXPECT_OK(projection->pose_roll(roll));
    TEST_EXPECT_EQ(yaw, 12.5);
    TEST_EXPECT_EQ(roll, -90.0);
  }

  const auto slot_node = build_ok(master(
    id::kSignatureSlot,
    {
      uint_element(id::kSignatureAlgo, 1),
      master(id::kSignatureElements,
             {master(id::kSignatureElementList,
                     {element(id::kSignedElement, bytes{0x15, 0x49, 0xA9, 0x66}),
                      element(id::kSignedElement, bytes{0x16, 0x54, 0xAE, 0x6B})})}),
    }));
  const ebml::schema::SignatureSlot slot(slot_node);

  std::optional<std::uint64_t> algo;
  std::optional<ebml::core::bytes_view> signature;
  TEST_EXPECT_OK(slot.algo(algo));
  TEST_EXPECT_OK(slot.signature(signature));
  TEST_EXPECT_EQ(algo.value_or(0), 1u);
  TEST_EXPECT(!signature.has_value());

  const auto elements = slot.signature_elements();
  TEST_EXPECT(elements.has_value());
  if (elements) {
    const auto lists = elements->element_lists();
    TEST_EXPECT_EQ(lists.size(), 1u);
    std::vector<ebml::core::bytes_view> signed_ids;
    if (!lists.empty()) {
      TEST_EXPECT_OK(lists[0].signed_elements(signed_ids));
    }
    TEST_EXPECT_EQ(signed_ids.size(), 2u);
  }
}

}  // namespace

int main() {
  test_mandatory_field_missing();
  test_optional_fields();
  test_repeated_fields_in_document_order();
  test_first_match_wins();
  test_boolean_exactly_one();
  test_sub_views();
  test_from_checks_id();
  test_default_view_reports_missing();
  test_decode_errors_propagate();
  test_field_errors_logged_with_ids();
  test_chapters_and_tags();
  test_projection_and_signature_views();
  return ::ebml::tests::run_and_report();
}
