#include "ebml/schema/ids.hpp"
#include "ebml/schema/registry.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <string_view>

namespace {

namespace id = ebml::schema::id;
using ebml::schema::element_kind;
using ebml::schema::element_name;
using ebml::schema::ElementKind;
using ebml::schema::find_element_info;
using ebml::schema::kind_name;
using ebml::schema::registered_elements;

void test_master_ids_are_masters() {
  for (std::uint64_t master_id :
       {id::kEBML, id::kSegment, id::kSeekHead, id::kSeek, id::kInfo, id::kCluster, id::kBlockGroup,
        id::kSlices, id::kTimeSlice, id::kTracks, id::kTrackEntry, id::kVideo, id::kProjection,
        id::kAudio, id::kContentEncodings, id::kContentEncoding, id::kContentEncryption,
        id::kContentEncAESSettings, id::kCues, id::kCuePoint, id::kCueTrackPositions, id::kChapters,
        id::kEditionEntry, id::kChapterAtom, id::kChapterDisplay, id::kTags, id::kTag, id::kTargets,
        id::kSimpleTag, id::kSignatureSlot, id::kSignatureElements, id::kSignatureElementList}) {
    TEST_EXPECT_EQ(element_kind(master_id), ElementKind::master);
  }
}

void test_scalar_kinds() {
  TEST_EXPECT_EQ(element_kind(id::kEBMLVersion), ElementKind::uinteger);
  TEST_EXPECT_EQ(element_kind(id::kDocType), ElementKind::string);
  TEST_EXPECT_EQ(element_kind(id::kTimestampScale), ElementKind::uinteger);
  TEST_EXPECT_EQ(element_kind(id::kDuration), ElementKind::floating);
  TEST_EXPECT_EQ(element_kind(id::kDateUTC), ElementKind::date);
  TEST_EXPECT_EQ(element_kind(id::kMuxingApp), ElementKind::utf8);
  TEST_EXPECT_EQ(element_kind(id::kSimpleBlock), ElementKind::binary);
  TEST_EXPECT_EQ(element_kind(id::kReferenceBlock), ElementKind::integer);
  TEST_EXPECT_EQ(element_kind(id::kDiscardPadding), ElementKind::integer);
  TEST_EXPECT_EQ(element_kind(id::kSamplingFrequency), ElementKind::floating);
  TEST_EXPECT_EQ(element_kind(id::kCodecID), ElementKind::string);
  TEST_EXPECT_EQ(element_kind(id::kSeekID), ElementKind::binary);
  // BlockDuration 是无符号整数（时长）。
  TEST_EXPECT_EQ(element_kind(id::kBlockDuration), ElementKind::uinteger);
}

void test_unregistered_ids() {
  TEST_EXPECT_EQ(element_kind(0x7FFF), ElementKind::unknown);
  TEST_EXPECT(element_name(0x7FFF).empty());
  TEST_EXPECT(find_element_info(0x7FFF) == nullptr);
  TEST_EXPECT(find_element_info(0) == nullptr);
}

void test_names() {
  TEST_EXPECT_EQ(element_name(id::kEBML), std::string_view("EBML"));
  TEST_EXPECT_EQ(element_name(id::kSegment), std::string_view("Segment"));
  TEST_EXPECT_EQ(element_name(id::kCRC32), std::string_view("CRC-32"));

  const auto* info = find_element_info(id::kTrackEntry);
  TEST_EXPECT(info != nullptr);
  if (info != nullptr) {
    TEST_EXPECT_EQ(info->id, id::kTrackEntry);
    TEST_EXPECT_EQ(info->name, std::string_view("TrackEntry"));
    TEST_EXPECT_EQ(info->kind, ElementKind::master);
  }

  TEST_EXPECT_EQ(kind_name(ElementKind::floating), std::string_view("float"));
  TEST_EXPECT_EQ(kind_name(ElementKind::unknown), std::string_view("unknown"));
}

void test_table_is_sorted_and_complete() {
  const auto table = registered_elements();
  TEST_EXPECT_EQ(table.size(), 126u);
  for (std::size_t i = 1; i < table.size(); ++i) {
    TEST_EXPECT(table[i - 1].id < table[i].id);
  }
  for (const auto& info : table) {
    TEST_EXPECT(!info.name.empty());
    TEST_EXPECT(info.kind != ElementKind::unknown);
    TEST_EXPECT(find_element_info(info.id) == &info);
  }
}

}  // namespace

int main() {
  test_master_ids_are_masters();
  test_scalar_kinds();
  test_unregistered_ids();
  test_names();
  test_table_is_sorted_and_complete();
  return ::ebml::tests::run_and_report();
}
