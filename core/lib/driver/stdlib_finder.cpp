// scopelink/driver/stdlib_finder.cpp - Standard library model auto-detection
//
#include "scopelink/driver/stdlib_finder.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace scopelink
{

std::optional<fs::path> find_stdlib_model()
{
  std::error_code ec;

  // 1. Installed path (from cmake install)
#ifdef SCOPELINK_STDLIB_INSTALL_PATH
  {
    const fs::path installed = fs::path(SCOPELINK_STDLIB_INSTALL_PATH) / k_stdlib_model_file_name;
    if (fs::is_regular_file(installed, ec)) {
      return installed;
    }
  }
#endif

  // 2. Relative to the executable: <prefix>/bin/scopelink, <prefix>/share/scopelink/std/
  {
    const auto exe_path = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
      const auto share_stdlib =
        exe_path.parent_path() / ".." / "share" / "scopelink" / "std" / k_stdlib_model_file_name;
      if (fs::is_regular_file(share_stdlib, ec)) {
        return fs::canonical(share_stdlib, ec);
      }
    }
  }

  // 3. Development layout: the model shipped in the source tree
#ifdef SCOPELINK_STDLIB_SOURCE_PATH
  {
    const fs::path source = fs::path(SCOPELINK_STDLIB_SOURCE_PATH) / k_stdlib_model_file_name;
    if (fs::is_regular_file(source, ec)) {
      return source;
    }
  }
#endif

  return std::nullopt;
}

}  // namespace scopelink
