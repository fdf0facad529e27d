// scopelink/driver/stdlib_finder.hpp - Standard library model auto-detection
//
// Locates the JSON model of the std packages (std.lang, std.lib, std.game)
// whose members the linker makes globally visible.
//
#pragma once

#include <filesystem>
#include <optional>

namespace scopelink
{

/// File name of the standard library model.
inline constexpr const char * k_stdlib_model_file_name = "std.json";

/**
 * Try to find the standard library model in standard locations.
 *
 * Search order:
 * 1. Installed path (from cmake install, SCOPELINK_STDLIB_INSTALL_PATH)
 * 2. Relative to executable: <prefix>/share/scopelink/std/std.json
 * 3. Source tree (SCOPELINK_STDLIB_SOURCE_PATH)
 *
 * @return Path to std.json, or nullopt if not found
 */
[[nodiscard]] std::optional<std::filesystem::path> find_stdlib_model();

}  // namespace scopelink
