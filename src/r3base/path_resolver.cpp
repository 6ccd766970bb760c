#include "r3base/path_resolver.hpp"

#include <system_error>

namespace r3::util {
namespace {

bool path_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

} // namespace

std::optional<std::filesystem::path> resolve_in_ancestors(
    const std::filesystem::path& target, const std::filesystem::path& start
) {
  if (path_exists(target)) {
    return target;
  }
  if (target.empty() || !target.is_relative()) {
    return std::nullopt;
  }

  std::filesystem::path dir = start;
  while (!dir.empty()) {
    auto candidate = dir / target;
    if (path_exists(candidate)) {
      return candidate;
    }

    auto parent = dir.parent_path();
    if (parent == dir) {
      break;
    }
    dir = parent;
  }

  return std::nullopt;
}

std::optional<std::filesystem::path> resolve_in_ancestors(const std::filesystem::path& target) {
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return path_exists(target) ? std::optional<std::filesystem::path>(target) : std::nullopt;
  }
  return resolve_in_ancestors(target, cwd);
}

} // namespace r3::util
