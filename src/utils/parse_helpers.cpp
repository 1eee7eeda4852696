#include "ebml/utils/parse_helpers.hpp"

#include "ebml/core/source.hpp"

#include <istream>

namespace ebml::utils {

std::pair<std::error_code, tree::Document>
parse_document_bytes(core::bytes_view in,
                     const tree::ParseOptions& options,
                     tree::ParseFailure* failure) noexcept {
  core::MemorySource source(in);
  tree::Document doc;
  auto ec = tree::parse_document(source, doc, options, failure);
  return {ec, std::move(doc)};
}

std::pair<std::error_code, tree::Document>
parse_document_stream(std::istream& in,
                      const tree::ParseOptions& options,
                      tree::ParseFailure* failure) noexcept {
  tree::Document doc;
  try {
    core::StreamSource source(in);
    auto ec = tree::parse_document(source, doc, options, failure);
    return {ec, std::move(doc)};
  } catch (const std::ios_base::failure&) {
    return {tree::make_error_code(tree::errc::io_error), tree::Document{}};
  }
}

std::pair<std::error_code, BuildTreeResult>
build_tree_bytes(core::bytes_view in, const tree::ParseOptions& options) noexcept {
  core::MemorySource source(in);
  BuildTreeResult result;
  auto ec = tree::build_tree(source, result.node, options);
  if (ec) {
    return {ec, BuildTreeResult{}};
  }
  result.consumed = static_cast<std::size_t>(source.position());
  result.fully_consumed = (result.consumed == in.size());
  return {ec, std::move(result)};
}

}  // namespace ebml::utils
