#include "ebml/schema/registry.hpp"

#include "ebml/schema/ids.hpp"

#include <algorithm>
#include <array>

namespace ebml::schema {
namespace {

using K = ElementKind;

// 登记表：ID -> {类别, 名称}。新增元素只需在这里追加一行。
constexpr std::array kElements = std::to_array<ElementInfo>({
    // master
    {id::kEBML, K::master, "EBML"},
    {id::kSegment, K::master, "Segment"},
    {id::kSeekHead, K::master, "SeekHead"},
    {id::kSeek, K::master, "Seek"},
    {id::kInfo, K::master, "Info"},
    {id::kCluster, K::master, "Cluster"},
    {id::kBlockGroup, K::master, "BlockGroup"},
    {id::kSlices, K::master, "Slices"},
    {id::kTimeSlice, K::master, "TimeSlice"},
    {id::kTracks, K::master, "Tracks"},
    {id::kTrackEntry, K::master, "TrackEntry"},
    {id::kVideo, K::master, "Video"},
    {id::kProjection, K::master, "Projection"},
    {id::kAudio, K::master, "Audio"},
    {id::kContentEncodings, K::master, "ContentEncodings"},
    {id::kContentEncoding, K::master, "ContentEncoding"},
    {id::kContentEncryption, K::master, "ContentEncryption"},
    {id::kContentEncAESSettings, K::master, "ContentEncAESSettings"},
    {id::kCues, K::master, "Cues"},
    {id::kCuePoint, K::master, "CuePoint"},
    {id::kCueTrackPositions, K::master, "CueTrackPositions"},
    {id::kChapters, K::master, "Chapters"},
    {id::kEditionEntry, K::master, "EditionEntry"},
    {id::kChapterAtom, K::master, "ChapterAtom"},
    {id::kChapterDisplay, K::master, "ChapterDisplay"},
    {id::kTags, K::master, "Tags"},
    {id::kTag, K::master, "Tag"},
    {id::kTargets, K::master, "Targets"},
    {id::kSimpleTag, K::master, "SimpleTag"},
    {id::kSignatureSlot, K::master, "SignatureSlot"},
    {id::kSignatureElements, K::master, "SignatureElements"},
    {id::kSignatureElementList, K::master, "SignatureElementList"},

    // EBML header
    {id::kEBMLVersion, K::uinteger, "EBMLVersion"},
    {id::kEBMLReadVersion, K::uinteger, "EBMLReadVersion"},
    {id::kEBMLMaxIDLength, K::uinteger, "EBMLMaxIDLength"},
    {id::kEBMLMaxSizeLength, K::uinteger, "EBMLMaxSizeLength"},
    {id::kDocType, K::string, "DocType"},
    {id::kDocTypeVersion, K::uinteger, "DocTypeVersion"},
    {id::kDocTypeReadVersion, K::uinteger, "DocTypeReadVersion"},
    {id::kCRC32, K::binary, "CRC-32"},
    {id::kVoid, K::binary, "Void"},

    // 签名
    {id::kSignatureAlgo, K::uinteger, "SignatureAlgo"},
    {id::kSignatureHash, K::uinteger, "SignatureHash"},
    {id::kSignaturePublicKey, K::binary, "SignaturePublicKey"},
    {id::kSignature, K::binary, "Signature"},
    {id::kSignedElement, K::binary, "SignedElement"},

    // SeekHead / Info
    {id::kSeekID, K::binary, "SeekID"},
    {id::kSeekPosition, K::uinteger, "SeekPosition"},
    {id::kSegmentUID, K::binary, "SegmentUID"},
    {id::kTimestampScale, K::uinteger, "TimestampScale"},
    {id::kDuration, K::floating, "Duration"},
    {id::kDateUTC, K::date, "DateUTC"},
    {id::kTitle, K::utf8, "Title"},
    {id::kMuxingApp, K::utf8, "MuxingApp"},
    {id::kWritingApp, K::utf8, "WritingApp"},

    // Cluster
    {id::kTimestamp, K::uinteger, "Timestamp"},
    {id::kPosition, K::uinteger, "Position"},
    {id::kPrevSize, K::uinteger, "PrevSize"},
    {id::kSimpleBlock, K::binary, "SimpleBlock"},
    {id::kBlock, K::binary, "Block"},
    {id::kBlockDuration, K::uinteger, "BlockDuration"},
    {id::kReferenceBlock, K::integer, "ReferenceBlock"},
    {id::kDiscardPadding, K::integer, "DiscardPadding"},
    {id::kLaceNumber, K::uinteger, "LaceNumber"},

    // TrackEntry
    {id::kTrackNumber, K::uinteger, "TrackNumber"},
    {id::kTrackUID, K::uinteger, "TrackUID"},
    {id::kTrackType, K::uinteger, "TrackType"},
    {id::kFlagEnabled, K::uinteger, "FlagEnabled"},
    {id::kFlagDefault, K::uinteger, "FlagDefault"},
    {id::kFlagForced, K::uinteger, "FlagForced"},
    {id::kFlagLacing, K::uinteger, "FlagLacing"},
    {id::kDefaultDuration, K::uinteger, "DefaultDuration"},
    {id::kTrackTimestampScale, K::floating, "TrackTimestampScale"},
    {id::kName, K::utf8, "Name"},
    {id::kLanguage, K::string, "Language"},
    {id::kCodecID, K::string, "CodecID"},
    {id::kCodecPrivate, K::binary, "CodecPrivate"},
    {id::kCodecName, K::utf8, "CodecName"},
    {id::kCodecDelay, K::uinteger, "CodecDelay"},
    {id::kSeekPreRoll, K::uinteger, "SeekPreRoll"},

    // Video / Projection
    {id::kFlagInterlaced, K::uinteger, "FlagInterlaced"},
    {id::kStereoMode, K::uinteger, "StereoMode"},
    {id::kAlphaMode, K::uinteger, "AlphaMode"},
    {id::kPixelWidth, K::uinteger, "PixelWidth"},
    {id::kPixelHeight, K::uinteger, "PixelHeight"},
    {id::kPixelCropBottom, K::uinteger, "PixelCropBottom"},
    {id::kPixelCropTop, K::uinteger, "PixelCropTop"},
    {id::kPixelCropLeft, K::uinteger, "PixelCropLeft"},
    {id::kPixelCropRight, K::uinteger, "PixelCropRight"},
    {id::kDisplayWidth, K::uinteger, "DisplayWidth"},
    {id::kDisplayHeight, K::uinteger, "DisplayHeight"},
    {id::kDisplayUnit, K::uinteger, "DisplayUnit"},
    {id::kAspectRatioType, K::uinteger, "AspectRatioType"},
    {id::kProjectionType, K::uinteger, "ProjectionType"},
    {id::kProjectionPrivate, K::binary, "ProjectionPrivate"},
    {id::kProjectionPoseYaw, K::floating, "ProjectionPoseYaw"},
    {id::kProjectionPosePitch, K::floating, "ProjectionPosePitch"},
    {id::kProjectionPoseRoll, K::floating, "ProjectionPoseRoll"},

    // Audio
    {id::kSamplingFrequency, K::floating, "SamplingFrequency"},
    {id::kOutputSamplingFrequency, K::floating, "OutputSamplingFrequency"},
    {id::kChannels, K::uinteger, "Channels"},
    {id::kBitDepth, K::uinteger, "BitDepth"},

    // ContentEncoding
    {id::kContentEncodingOrder, K::uinteger, "ContentEncodingOrder"},
    {id::kContentEncodingScope, K::uinteger, "ContentEncodingScope"},
    {id::kContentEncodingType, K::uinteger, "ContentEncodingType"},
    {id::kContentEncAlgo, K::uinteger, "ContentEncAlgo"},
    {id::kContentEncKeyID, K::binary, "ContentEncKeyID"},
    {id::kAESSettingsCipherMode, K::uinteger, "AESSettingsCipherMode"},

    // Cues
    {id::kCueTime, K::uinteger, "CueTime"},
    {id::kCueTrack, K::uinteger, "CueTrack"},
    {id::kCueClusterPosition, K::uinteger, "CueClusterPosition"},
    {id::kCueBlockNumber, K::uinteger, "CueBlockNumber"},

    // Chapters
    {id::kChapterUID, K::uinteger, "ChapterUID"},
    {id::kChapterStringUID, K::utf8, "ChapterStringUID"},
    {id::kChapterTimeStart, K::uinteger, "ChapterTimeStart"},
    {id::kChapterTimeEnd, K::uinteger, "ChapterTimeEnd"},
    {id::kChapString, K::utf8, "ChapString"},
    {id::kChapLanguage, K::string, "ChapLanguage"},

    // Tags
    {id::kTargetTypeValue, K::uinteger, "TargetTypeValue"},
    {id::kTargetType, K::string, "TargetType"},
    {id::kTagTrackUID, K::uinteger, "TagTrackUID"},
    {id::kTagName, K::utf8, "TagName"},
    {id::kTagLanguage, K::string, "TagLanguage"},
    {id::kTagDefault, K::uinteger, "TagDefault"},
    {id::kTagString, K::utf8, "TagString"},
    {id::kTagBinary, K::binary, "TagBinary"},
});

constexpr auto kSortedElements = [] {
    auto sorted = kElements;
    std::sort(sorted.begin(), sorted.end(), [](const ElementInfo &a, const ElementInfo &b) {
        return a.id < b.id;
    });
    return sorted;
}();

constexpr bool has_unique_ids() {
    for (std::size_t i = 1; i < kSortedElements.size(); ++i) {
        if (kSortedElements[i - 1].id == kSortedElements[i].id) {
            return false;
        }
    }
    return true;
}

static_assert(has_unique_ids(), "duplicate element id in registry");

} // namespace

const ElementInfo *find_element_info(std::uint64_t id) noexcept {
    const auto it = std::lower_bound(
        kSortedElements.begin(), kSortedElements.end(), id,
        [](const ElementInfo &info, std::uint64_t value) { return info.id < value; });
    if (it == kSortedElements.end() || it->id != id) {
        return nullptr;
    }
    return &*it;
}

ElementKind element_kind(std::uint64_t id) noexcept {
    const auto *info = find_element_info(id);
    return info != nullptr ? info->kind : ElementKind::unknown;
}

std::string_view element_name(std::uint64_t id) noexcept {
    const auto *info = find_element_info(id);
    return info != nullptr ? info->name : std::string_view{};
}

std::string_view kind_name(ElementKind kind) noexcept {
    switch (kind) {
    case ElementKind::master:
        return "master";
    case ElementKind::uinteger:
        return "uinteger";
    case ElementKind::integer:
        return "integer";
    case ElementKind::floating:
        return "float";
    case ElementKind::string:
        return "string";
    case ElementKind::utf8:
        return "utf-8";
    case ElementKind::date:
        return "date";
    case ElementKind::binary:
        return "binary";
    case ElementKind::unknown:
        break;
    }
    return "unknown";
}

std::span<const ElementInfo> registered_elements() noexcept {
    return std::span<const ElementInfo>{kSortedElements.data(), kSortedElements.size()};
}

} // namespace ebml::schema
