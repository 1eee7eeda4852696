#pragma once

#include "ebml/core/common.hpp"
#include "ebml/schema/ids.hpp"
#include "ebml/tree/node.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace ebml::schema {

enum class errc : int {
  ok = 0,
  missing_field = 1,
  wrong_element = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

namespace detail {

// 字段值的解码入口：按 getter 声明的目标类型选择 ElementData 的转换。
inline std::error_code decode(const tree::ElementData& data, std::uint64_t& out) noexcept {
  return data.to_uint(out);
}

inline std::error_code decode(const tree::ElementData& data, std::int64_t& out) noexcept {
  return data.to_int(out);
}

inline std::error_code decode(const tree::ElementData& data, double& out) noexcept {
  return data.to_float(out);
}

inline std::error_code decode(const tree::ElementData& data, std::string& out) noexcept {
  return data.to_utf8(out);
}

inline std::error_code decode(const tree::ElementData& data, bool& out) noexcept {
  return data.to_bool(out);
}

// binary 字段直接引用 Document 内的字节，生命周期跟随 Document。
inline std::error_code decode(const tree::ElementData& data, core::bytes_view& out) noexcept {
  out = data.bytes();
  return {};
}

// 字段失败时在 debug 级别记录所属节点与字段 ID，原样返回 ec。
std::error_code field_error(std::uint64_t parent_id, std::uint64_t field_id, std::error_code ec) noexcept;

}  // namespace detail

/**
 * @brief 只读语义视图基类：包装一个 master 节点，只查询其直接子节点。
 *
 * 字段基数约定：
 * - required_field：取第一个匹配子节点并解码；不存在返回 errc::missing_field
 * - optional_field：不存在时输出 nullopt，不视为错误
 * - repeated_field：按文档顺序收集全部匹配子节点（可能为空）
 *
 * 失败的错误码本身不带元素 ID，失败位置（节点 ID 与字段 ID）写入 debug 日志。
 *
 * 视图不拥有数据，调用方需保证 Document 在视图生命周期内有效。
 * 默认构造的视图无效（valid()==false），所有必选字段均返回 missing_field。
 */
class NodeView {
 public:
  NodeView() = default;
  explicit NodeView(const tree::Node& node) noexcept : node_(&node) {}

  [[nodiscard]] bool valid() const noexcept { return node_ != nullptr; }

  // 前置条件：valid()。
  [[nodiscard]] const tree::Node& node() const noexcept { return *node_; }

  [[nodiscard]] std::uint64_t id() const noexcept { return node_ != nullptr ? node_->element.id : 0; }

 protected:
  template <class T>
  std::error_code required_field(std::uint64_t id, T& out) const {
    const auto* child = find_(id);
    if (child == nullptr) {
      return detail::field_error(this->id(), id, make_error_code(errc::missing_field));
    }
    T value{};
    auto ec = detail::decode(child->element.data, value);
    if (ec) {
      return detail::field_error(this->id(), id, ec);
    }
    out = std::move(value);
    return {};
  }

  template <class T>
  std::error_code optional_field(std::uint64_t id, std::optional<T>& out) const {
    const auto* child = find_(id);
    if (child == nullptr) {
      out.reset();
      return {};
    }
    T value{};
    auto ec = detail::decode(child->element.data, value);
    if (ec) {
      return detail::field_error(this->id(), id, ec);
    }
    out = std::move(value);
    return {};
  }

  template <class T>
  std::error_code repeated_field(std::uint64_t id, std::vector<T>& out) const {
    std::vector<T> values;
    if (node_ != nullptr) {
      for (const auto& child : node_->children) {
        if (child.element.id != id) {
          continue;
        }
        T value{};
        auto ec = detail::decode(child.element.data, value);
        if (ec) {
          return detail::field_error(this->id(), id, ec);
        }
        values.push_back(std::move(value));
      }
    }
    out = std::move(values);
    return {};
  }

  template <class View>
  std::error_code required_child(View& out) const {
    const auto* child = find_(View::kId);
    if (child == nullptr) {
      return detail::field_error(id(), View::kId, make_error_code(errc::missing_field));
    }
    out = View(*child);
    return {};
  }

  template <class View>
  [[nodiscard]] std::optional<View> optional_child() const {
    const auto* child = find_(View::kId);
    if (child == nullptr) {
      return std::nullopt;
    }
    return View(*child);
  }

  template <class View>
  [[nodiscard]] std::vector<View> child_views() const {
    std::vector<View> out;
    if (node_ != nullptr) {
      for (const auto& child : node_->children) {
        if (child.element.id == View::kId) {
          out.emplace_back(child);
        }
      }
    }
    return out;
  }

 private:
  [[nodiscard]] const tree::Node* find_(std::uint64_t id) const noexcept {
    return node_ != nullptr ? node_->find_child(id) : nullptr;
  }

  const tree::Node* node_{nullptr};
};

/**
 * @brief 绑定元素 ID 的视图基类（CRTP）。
 *
 * from() 只在节点 ID 与 kId 一致时构造视图，否则返回 errc::wrong_element。
 */
template <class Derived, std::uint64_t Id>
class ElementView : public NodeView {
 public:
  static constexpr std::uint64_t kId = Id;

  ElementView() = default;
  explicit ElementView(const tree::Node& node) noexcept : NodeView(node) {}

  static std::error_code from(const tree::Node& node, Derived& out) noexcept {
    if (node.element.id != kId) {
      return make_error_code(errc::wrong_element);
    }
    out = Derived(node);
    return {};
  }
};

}  // namespace ebml::schema

namespace std {
template <>
struct is_error_code_enum<ebml::schema::errc> : true_type {};
}  // namespace std
