#include "ebml/schema/view.hpp"

#include "ebml/schema/registry.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace ebml::schema {
namespace {

class schema_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "ebml.schema"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::missing_field:
        return "mandatory field missing";
      case errc::wrong_element:
        return "node id does not match view";
      default:
        return "unknown ebml.schema error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static schema_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

namespace detail {

std::error_code field_error(std::uint64_t parent_id, std::uint64_t field_id, std::error_code ec) noexcept {
  spdlog::debug("ebml field failed: parent=0x{:X} ({}) field=0x{:X} ({}): {}",
                parent_id,
                element_name(parent_id),
                field_id,
                element_name(field_id),
                ec.message());
  return ec;
}

}  // namespace detail

}  // namespace ebml::schema
