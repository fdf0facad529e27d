// scopelink/link/link_error.cpp - LinkError conversion
//
#include "scopelink/link/link_error.hpp"

namespace scopelink
{

Diagnostic LinkError::to_diagnostic(std::string_view message) const
{
  Diagnostic diag;
  diag.severity = level();
  diag.code = code_;
  diag.message = message.empty() ? code_ : std::string(message);
  diag.values = values();
  return diag;
}

}  // namespace scopelink
