#pragma once

#include "ebml/core/common.hpp"
#include "ebml/tree/document.hpp"
#include "ebml/tree/node.hpp"
#include "ebml/tree/parser.hpp"

#include <cstddef>
#include <iosfwd>
#include <system_error>
#include <utility>

namespace ebml::utils {

/**
 * @brief 解析入口的轻量包装：内存缓冲区 / 已打开的流 -> {ec, 结果}。
 *
 * 只做 ByteSource 的构造与结果打包，不改变 tree::parse_document 的语义。
 */

struct BuildTreeResult final {
  tree::Node node{};

  // 消耗的输入字节数（成功时有意义）。
  std::size_t consumed{0};

  // 是否恰好消耗完整个输入（没有尾随字节）。
  bool fully_consumed{false};
};

[[nodiscard]] std::pair<std::error_code, tree::Document>
parse_document_bytes(core::bytes_view in,
                     const tree::ParseOptions& options = {},
                     tree::ParseFailure* failure = nullptr) noexcept;

/**
 * @brief 从调用方打开的流（建议 std::ios::binary）解析文档。
 */
[[nodiscard]] std::pair<std::error_code, tree::Document>
parse_document_stream(std::istream& in,
                      const tree::ParseOptions& options = {},
                      tree::ParseFailure* failure = nullptr) noexcept;

/**
 * @brief 从缓冲区起点构建一棵子树（不校验签名）。
 */
[[nodiscard]] std::pair<std::error_code, BuildTreeResult>
build_tree_bytes(core::bytes_view in, const tree::ParseOptions& options = {}) noexcept;

}  // namespace ebml::utils
