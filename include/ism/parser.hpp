#pragma once

#include "ism/registry.hpp"
#include "ism/utility.hpp"

#include <filesystem>
#include <string_view>

namespace imagesmith {

/**
 * @brief Loads a DockerMake-style YAML manifest into the registry.
 *
 * Each top-level key defines a unit (`FROM`, `requires`, `build_directory`, `build`,
 * `description`), except `_ALL_`, which lists the default targets. Relative build
 * directories are resolved against the manifest's directory.
 *
 * @return `ManifestError` for malformed YAML or unknown keys, `DuplicateName` from the registry.
 */
Result<void> parse(UnitRegistry &registry, const std::filesystem::path &path);

/** @brief Same as `parse`, from an in-memory document. */
Result<void> parse_string(UnitRegistry &registry, std::string_view content, const std::filesystem::path &base_dir);

} // namespace imagesmith
