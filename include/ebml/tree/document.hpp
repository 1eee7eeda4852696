#pragma once

#include "ebml/tree/node.hpp"

#include <utility>

namespace ebml::tree {

/**
 * @brief 解析结果：恰好两个顶层节点。
 *
 * - header：EBML 头（ID 0x1A45DFA3，由签名校验保证）
 * - root：紧随其后的 Segment（不再校验 ID）
 *
 * 构建后只读；多个线程可无锁并发读取。
 */
class Document final {
 public:
  Document() = default;
  Document(Node header, Node root) noexcept : header_(std::move(header)), root_(std::move(root)) {}

  [[nodiscard]] const Node& header() const noexcept { return header_; }
  [[nodiscard]] const Node& root() const noexcept { return root_; }

 private:
  Node header_{};
  Node root_{};
};

}  // namespace ebml::tree
