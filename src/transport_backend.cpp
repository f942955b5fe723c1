#include "transport_backend.hpp"

std::filesystem::path relative_subdirectory(const std::filesystem::path& source_root,
                                            const std::filesystem::path& file) {
  if(source_root.empty()) return {};
  auto root = source_root.lexically_normal();
  auto parent = file.parent_path().lexically_normal();
  auto rel = parent.lexically_relative(root);
  if(rel.empty() || rel == ".") return {};
  if(rel.begin()->string() == "..") return {};
  return rel;
}
