#pragma once

#include <cstdint>

/**
 * @brief Matroska/WebM 元素 ID（含长度前缀的原始值）。
 *
 * master 元素在前，其余按所属父元素分组。
 */
namespace ebml::schema::id {

// master（容器）元素
inline constexpr std::uint64_t kEBML = 0x1A45DFA3;
inline constexpr std::uint64_t kSegment = 0x18538067;
inline constexpr std::uint64_t kSeekHead = 0x114D9B74;
inline constexpr std::uint64_t kSeek = 0x4DBB;
inline constexpr std::uint64_t kInfo = 0x1549A966;
inline constexpr std::uint64_t kCluster = 0x1F43B675;
inline constexpr std::uint64_t kBlockGroup = 0xA0;
inline constexpr std::uint64_t kSlices = 0x8E;
inline constexpr std::uint64_t kTimeSlice = 0xE8;
inline constexpr std::uint64_t kTracks = 0x1654AE6B;
inline constexpr std::uint64_t kTrackEntry = 0xAE;
inline constexpr std::uint64_t kVideo = 0xE0;
inline constexpr std::uint64_t kProjection = 0x7670;
inline constexpr std::uint64_t kAudio = 0xE1;
inline constexpr std::uint64_t kContentEncodings = 0x6D80;
inline constexpr std::uint64_t kContentEncoding = 0x6240;
inline constexpr std::uint64_t kContentEncryption = 0x5035;
inline constexpr std::uint64_t kContentEncAESSettings = 0x47E7;
inline constexpr std::uint64_t kCues = 0x1C53BB6B;
inline constexpr std::uint64_t kCuePoint = 0xBB;
inline constexpr std::uint64_t kCueTrackPositions = 0xB7;
inline constexpr std::uint64_t kChapters = 0x1043A770;
inline constexpr std::uint64_t kEditionEntry = 0x45B9;
inline constexpr std::uint64_t kChapterAtom = 0xB6;
inline constexpr std::uint64_t kChapterDisplay = 0x80;
inline constexpr std::uint64_t kTags = 0x1254C367;
inline constexpr std::uint64_t kTag = 0x7373;
inline constexpr std::uint64_t kTargets = 0x63C0;
inline constexpr std::uint64_t kSimpleTag = 0x67C8;
inline constexpr std::uint64_t kSignatureSlot = 0x1B538667;
inline constexpr std::uint64_t kSignatureElements = 0x7E5B;
inline constexpr std::uint64_t kSignatureElementList = 0x7E7B;

// EBML header
inline constexpr std::uint64_t kEBMLVersion = 0x4286;
inline constexpr std::uint64_t kEBMLReadVersion = 0x42F7;
inline constexpr std::uint64_t kEBMLMaxIDLength = 0x42F2;
inline constexpr std::uint64_t kEBMLMaxSizeLength = 0x42F3;
inline constexpr std::uint64_t kDocType = 0x4282;
inline constexpr std::uint64_t kDocTypeVersion = 0x4287;
inline constexpr std::uint64_t kDocTypeReadVersion = 0x4285;

// 全局元素
inline constexpr std::uint64_t kCRC32 = 0xBF;
inline constexpr std::uint64_t kVoid = 0xEC;

// 签名
inline constexpr std::uint64_t kSignatureAlgo = 0x7E8A;
inline constexpr std::uint64_t kSignatureHash = 0x7E9A;
inline constexpr std::uint64_t kSignaturePublicKey = 0x7EA5;
inline constexpr std::uint64_t kSignature = 0x7EB5;
inline constexpr std::uint64_t kSignedElement = 0x6532;

// SeekHead
inline constexpr std::uint64_t kSeekID = 0x53AB;
inline constexpr std::uint64_t kSeekPosition = 0x53AC;

// Info
inline constexpr std::uint64_t kSegmentUID = 0x73A4;
inline constexpr std::uint64_t kTimestampScale = 0x2AD7B1;
inline constexpr std::uint64_t kDuration = 0x4489;
inline constexpr std::uint64_t kDateUTC = 0x4461;
inline constexpr std::uint64_t kTitle = 0x7BA9;
inline constexpr std::uint64_t kMuxingApp = 0x4D80;
inline constexpr std::uint64_t kWritingApp = 0x5741;

// Cluster / BlockGroup
inline constexpr std::uint64_t kTimestamp = 0xE7;
inline constexpr std::uint64_t kPosition = 0xA7;
inline constexpr std::uint64_t kPrevSize = 0xAB;
inline constexpr std::uint64_t kSimpleBlock = 0xA3;
inline constexpr std::uint64_t kBlock = 0xA1;
inline constexpr std::uint64_t kBlockDuration = 0x9B;
inline constexpr std::uint64_t kReferenceBlock = 0xFB;
inline constexpr std::uint64_t kDiscardPadding = 0x75A2;
inline constexpr std::uint64_t kLaceNumber = 0xCC;

// TrackEntry
inline constexpr std::uint64_t kTrackNumber = 0xD7;
inline constexpr std::uint64_t kTrackUID = 0x73C5;
inline constexpr std::uint64_t kTrackType = 0x83;
inline constexpr std::uint64_t kFlagEnabled = 0xB9;
inline constexpr std::uint64_t kFlagDefault = 0x88;
inline constexpr std::uint64_t kFlagForced = 0x55AA;
inline constexpr std::uint64_t kFlagLacing = 0x9C;
inline constexpr std::uint64_t kDefaultDuration = 0x23E383;
inline constexpr std::uint64_t kTrackTimestampScale = 0x23314F;
inline constexpr std::uint64_t kName = 0x536E;
inline constexpr std::uint64_t kLanguage = 0x22B59C;
inline constexpr std::uint64_t kCodecID = 0x86;
inline constexpr std::uint64_t kCodecPrivate = 0x63A2;
inline constexpr std::uint64_t kCodecName = 0x258688;
inline constexpr std::uint64_t kCodecDelay = 0x56AA;
inline constexpr std::uint64_t kSeekPreRoll = 0x56BB;

// Video / Projection
inline constexpr std::uint64_t kFlagInterlaced = 0x9A;
inline constexpr std::uint64_t kStereoMode = 0x53B8;
inline constexpr std::uint64_t kAlphaMode = 0x53C0;
inline constexpr std::uint64_t kPixelWidth = 0xB0;
inline constexpr std::uint64_t kPixelHeight = 0xBA;
inline constexpr std::uint64_t kPixelCropBottom = 0x54AA;
inline constexpr std::uint64_t kPixelCropTop = 0x54BB;
inline constexpr std::uint64_t kPixelCropLeft = 0x54CC;
inline constexpr std::uint64_t kPixelCropRight = 0x54DD;
inline constexpr std::uint64_t kDisplayWidth = 0x54B0;
inline constexpr std::uint64_t kDisplayHeight = 0x54BA;
inline constexpr std::uint64_t kDisplayUnit = 0x54B2;
inline constexpr std::uint64_t kAspectRatioType = 0x54B3;
inline constexpr std::uint64_t kProjectionType = 0x7671;
inline constexpr std::uint64_t kProjectionPrivate = 0x7672;
inline constexpr std::uint64_t kProjectionPoseYaw = 0x7673;
inline constexpr std::uint64_t kProjectionPosePitch = 0x7674;
inline constexpr std::uint64_t kProjectionPoseRoll = 0x7675;

// Audio
inline constexpr std::uint64_t kSamplingFrequency = 0xB5;
inline constexpr std::uint64_t kOutputSamplingFrequency = 0x78B5;
inline constexpr std::uint64_t kChannels = 0x9F;
inline constexpr std::uint64_t kBitDepth = 0x6264;

// ContentEncoding
inline constexpr std::uint64_t kContentEncodingOrder = 0x5031;
inline constexpr std::uint64_t kContentEncodingScope = 0x5032;
inline constexpr std::uint64_t kContentEncodingType = 0x5033;
inline constexpr std::uint64_t kContentEncAlgo = 0x47E1;
inline constexpr std::uint64_t kContentEncKeyID = 0x47E2;
inline constexpr std::uint64_t kAESSettingsCipherMode = 0x47E8;

// Cues
inline constexpr std::uint64_t kCueTime = 0xB3;
inline constexpr std::uint64_t kCueTrack = 0xF7;
inline constexpr std::uint64_t kCueClusterPosition = 0xF1;
inline constexpr std::uint64_t kCueBlockNumber = 0x5378;

// Chapters
inline constexpr std::uint64_t kChapterUID = 0x73C4;
inline constexpr std::uint64_t kChapterStringUID = 0x5654;
inline constexpr std::uint64_t kChapterTimeStart = 0x91;
inline constexpr std::uint64_t kChapterTimeEnd = 0x92;
inline constexpr std::uint64_t kChapString = 0x85;
inline constexpr std::uint64_t kChapLanguage = 0x437C;

// Tags
inline constexpr std::uint64_t kTargetTypeValue = 0x68CA;
inline constexpr std::uint64_t kTargetType = 0x63CA;
inline constexpr std::uint64_t kTagTrackUID = 0x63C5;
inline constexpr std::uint64_t kTagName = 0x45A3;
inline constexpr std::uint64_t kTagLanguage = 0x447A;
inline constexpr std::uint64_t kTagDefault = 0x4484;
inline constexpr std::uint64_t kTagString = 0x4487;
inline constexpr std::uint64_t kTagBinary = 0x4485;

}  // namespace ebml::schema::id
