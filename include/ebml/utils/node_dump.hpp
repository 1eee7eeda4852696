#pragma once

#include "ebml/tree/document.hpp"
#include "ebml/tree/node.hpp"

#include <cstddef>
#include <string>

namespace ebml::utils {

/**
 * @brief 元素树的可读化输出（调试/日志用途）。
 *
 * 每个元素一行：
 *
 *   [0x4286] EBMLVersion (uinteger, size=1) = 1
 *
 * - 未登记 ID 显示为 Unknown，值按 16 进制字节输出；
 * - 字符串加引号并转义不可打印字符；整数/日期十进制；浮点十进制；
 * - master 元素的子元素逐层缩进。
 */
struct NodeDumpOptions final {
  // 递归最大深度（0 表示只输出根节点）。
  std::size_t max_depth{32};

  // 每个 master 最多输出的子元素数（0 表示不限制）。
  std::size_t max_children{0};

  // 字符串/二进制最多输出的字节数（0 表示不限制）。
  std::size_t max_payload_bytes{32};

  // 每层缩进空格数。
  std::size_t indent_spaces{2};

  // 每行附带元素 ID 首字节的绝对偏移（"@1234"）。
  bool show_offset{false};

  // ANSI 颜色（写入日志/文件时关闭）。
  bool enable_color{false};
};

[[nodiscard]] std::string dump_node(const tree::Node& node, NodeDumpOptions options = {});

/**
 * @brief 依次输出 header 与 root。
 */
[[nodiscard]] std::string dump_document(const tree::Document& doc, NodeDumpOptions options = {});

}  // namespace ebml::utils
