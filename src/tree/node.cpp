#include "ebml/tree/node.hpp"

#include "ebml/codec/primitive.hpp"

namespace ebml::tree {

std::error_code ElementData::to_uint(std::uint64_t& out) const noexcept {
  return codec::bytes_to_uint(bytes(), out);
}

std::error_code ElementData::to_int(std::int64_t& out) const noexcept {
  return codec::bytes_to_int(bytes(), out);
}

std::error_code ElementData::to_float(double& out) const noexcept {
  return codec::bytes_to_float(bytes(), out);
}

std::error_code ElementData::to_utf8(std::string& out) const noexcept {
  return codec::bytes_to_utf8(bytes(), out);
}

std::error_code ElementData::to_bool(bool& out) const noexcept {
  std::uint64_t v = 0;
  auto ec = to_uint(v);
  if (ec) {
    return ec;
  }
  // 只有 1 为真，2/0xFF 等其他非零值都视为假。
  out = (v == 1);
  return {};
}

const Node* Node::find_child(std::uint64_t id) const noexcept {
  for (const auto& child : children) {
    if (child.element.id == id) {
      return &child;
    }
  }
  return nullptr;
}

std::vector<const Node*> Node::find_children(std::uint64_t id) const {
  std::vector<const Node*> out;
  for (const auto& child : children) {
    if (child.element.id == id) {
      out.push_back(&child);
    }
  }
  return out;
}

}  // namespace ebml::tree
