// scopelink/link/link_error.hpp - Problem value raised by link-time checks
//
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "scopelink/basic/diagnostic.hpp"

namespace scopelink
{

/**
 * A link problem identified only by its code.
 *
 * The level is always Error, there are no formatting values and no source map.
 * The linker never produces one itself; checks built on top of a linked
 * Environment (such as the driver's reference checker) do.
 */
class LinkError
{
public:
  explicit LinkError(std::string code) : code_(std::move(code)) {}

  [[nodiscard]] const std::string & code() const noexcept { return code_; }

  [[nodiscard]] Severity level() const noexcept { return Severity::Error; }

  [[nodiscard]] std::vector<std::string> values() const { return {}; }

  /// Always absent: the linked model carries no source positions.
  [[nodiscard]] bool has_source_map() const noexcept { return false; }

  /**
   * Convert into a Diagnostic with the given message.
   *
   * @param message Human readable summary; the code is used when empty
   */
  [[nodiscard]] Diagnostic to_diagnostic(std::string_view message = {}) const;

private:
  std::string code_;
};

}  // namespace scopelink
