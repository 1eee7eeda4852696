#include "ebml/core/source.hpp"

#include <algorithm>
#include <cstring>
#include <ios>
#include <istream>
#include <limits>

namespace ebml::core {

std::error_code MemorySource::read(mutable_bytes_view out) noexcept {
  if (out.empty()) {
    return {};
  }
  if (pos_ > data_.size() || out.size() > data_.size() - pos_) {
    // 与流式实现保持一致：短读时游标推进到末尾。
    pos_ = data_.size();
    return make_error_code(errc::end_of_stream);
  }
  std::memcpy(out.data(), data_.data() + pos_, out.size());
  pos_ += out.size();
  return {};
}

std::error_code MemorySource::seek(std::uint64_t offset) noexcept {
  if (offset > data_.size()) {
    return make_error_code(errc::invalid_argument);
  }
  pos_ = static_cast<std::size_t>(offset);
  return {};
}

/*
 * StreamSource 的位置模型：
 * - base_ 为构造时流的读位置，对外的 offset 0 即 base_；
 *   这样调用方可以把“从文件中间开始的 EBML 流”交给解析器；
 * - pos_ 由本类自行维护，不依赖每次 tellg()（部分流实现 tellg 代价较高）。
 */
StreamSource::StreamSource(std::istream &in) : in_(&in) {
  const auto start = in.tellg();
  if (start == std::streampos(-1)) {
    in.clear();
    return;
  }
  base_ = static_cast<std::uint64_t>(static_cast<std::streamoff>(start));

  in.seekg(0, std::ios::end);
  const auto end = in.tellg();
  if (end != std::streampos(-1) && end >= start) {
    size_ = static_cast<std::uint64_t>(static_cast<std::streamoff>(end - start));
  }
  in.clear();
  in.seekg(start);
}

std::error_code StreamSource::read(mutable_bytes_view out) noexcept {
  if (out.empty()) {
    return {};
  }
  try {
    std::size_t done = 0;
    while (done < out.size()) {
      const auto chunk = std::min<std::size_t>(
        out.size() - done,
        static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max()));
      in_->read(reinterpret_cast<char *>(out.data() + done), static_cast<std::streamsize>(chunk));
      const auto got = static_cast<std::size_t>(in_->gcount());
      done += got;
      pos_ += got;
      if (got != chunk) {
        const bool eof = in_->eof();
        in_->clear();
        return make_error_code(eof ? errc::end_of_stream : errc::io_error);
      }
    }
  } catch (const std::ios_base::failure &) {
    // 调用方可能给流开启了异常掩码；统一折算为错误码。
    in_->clear();
    return make_error_code(errc::io_error);
  }
  return {};
}

std::error_code StreamSource::seek(std::uint64_t offset) noexcept {
  if (size_ && offset > *size_) {
    return make_error_code(errc::invalid_argument);
  }
  if (offset > static_cast<std::uint64_t>(std::numeric_limits<std::streamoff>::max()) - base_) {
    return make_error_code(errc::invalid_argument);
  }
  try {
    in_->clear();
    in_->seekg(static_cast<std::streamoff>(base_ + offset), std::ios::beg);
    if (!*in_) {
      in_->clear();
      return make_error_code(errc::io_error);
    }
  } catch (const std::ios_base::failure &) {
    in_->clear();
    return make_error_code(errc::io_error);
  }
  pos_ = offset;
  return {};
}

}  // namespace ebml::core
