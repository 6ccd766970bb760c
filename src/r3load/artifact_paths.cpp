#include "r3load/artifact_paths.hpp"

#include "r3base/platform_utils.hpp"

namespace r3::load {
namespace {

void replace_all(std::string& text, const std::string& needle, const std::string& replacement) {
  size_t pos = 0;
  while ((pos = text.find(needle, pos)) != std::string::npos) {
    text.replace(pos, needle.size(), replacement);
    pos += replacement.size();
  }
}

} // namespace

std::string render_loaded_name(
    const std::string& name_template, const std::string& lib_name, uint64_t load_counter, uint64_t pid
) {
  std::string name = name_template;
  replace_all(name, "{lib_name}", lib_name);
  replace_all(name, "{load_counter}", std::to_string(load_counter));
  replace_all(name, "{pid}", std::to_string(pid));
  return name;
}

artifact_paths compute_artifact_paths(
    const std::filesystem::path& lib_dir, const std::string& lib_name, uint64_t load_counter,
    const std::optional<std::string>& name_template, uint64_t pid
) {
  artifact_paths paths;
  paths.watched = lib_dir / util::platform_utils::library_file_name(lib_name);

  std::string loaded_name =
      render_loaded_name(name_template.value_or(kDefaultLoadedNameTemplate), lib_name, load_counter, pid);
  paths.loaded = lib_dir / (loaded_name + util::platform_utils::get_library_extension());
  return paths;
}

} // namespace r3::load
