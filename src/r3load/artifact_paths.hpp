#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace r3::load {

inline constexpr const char* kDefaultLoadedNameTemplate = "{lib_name}-hot-{load_counter}";

struct artifact_paths {
  std::filesystem::path watched{};
  std::filesystem::path loaded{};
};

/**
 * @brief Expand a loaded-copy name template
 *
 * Replaces every `{lib_name}`, `{load_counter}` and `{pid}` in @p name_template. Unknown placeholders are left as
 * they are. The platform library extension is not appended here.
 */
std::string render_loaded_name(
    const std::string& name_template, const std::string& lib_name, uint64_t load_counter, uint64_t pid
);

/**
 * @brief Compute where a library is built and where its private copy for a given cycle lives
 *
 * The watched path is `lib_dir / <prefix><lib_name><ext>` using the platform naming convention. The loaded path sits
 * next to it and is named from @p name_template (or the default template) with the platform extension appended.
 */
artifact_paths compute_artifact_paths(
    const std::filesystem::path& lib_dir, const std::string& lib_name, uint64_t load_counter,
    const std::optional<std::string>& name_template, uint64_t pid
);

} // namespace r3::load
