#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace ebml::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 解析递归深度默认上限：真实 WebM/Matroska 文件嵌套不超过 10 层左右，
// 这里留足余量，同时避免恶意输入构造极深嵌套导致栈溢出。
inline constexpr std::size_t kDefaultMaxDepth = 64;

// 单个非 master 元素 payload 的默认上限：payload 会被整体读入内存，
// 声明长度来自不可信输入，需要上限避免巨量分配。
inline constexpr std::uint64_t kDefaultMaxElementSize = 256ull * 1024ull * 1024ull;  // 256MB

}  // 命名空间 ebml::core
