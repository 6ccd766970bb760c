#pragma once

#include <filesystem>
#include <optional>

namespace r3::util {

/**
 * @brief Locate a file or directory that may be given relative to some ancestor of the working directory
 *
 * If @p target exists as given it is returned unchanged. If it is relative and missing, @p start and each of
 * its ancestors are tried in turn (`ancestor / target`) and the first existing candidate is returned. This lets a
 * host started from any subdirectory of a project find e.g. "build/lib".
 *
 * @param target Path to look for
 * @param start Directory the upward walk starts from
 * @return The existing path, or nullopt if no candidate exists
 */
std::optional<std::filesystem::path> resolve_in_ancestors(
    const std::filesystem::path& target, const std::filesystem::path& start
);

// same as above, starting from the current working directory
std::optional<std::filesystem::path> resolve_in_ancestors(const std::filesystem::path& target);

} // namespace r3::util
