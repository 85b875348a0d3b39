#pragma once

#include <string>
#include <ostream>
#include <stdexcept>

namespace anipler
{
  enum class error_kind
  {
    conflict,           // Precondition on the current state violated.
    not_found,
    invalid_transition, // State change not reachable from the current state.
    transient,          // Network or copy failure, retry later.
    unauthorized,
    fatal               // Store corruption or bad configuration.
  };

  std::string
  to_string (error_kind);

  inline std::ostream&
  operator<< (std::ostream& os, error_kind k)
  {
    return os << to_string (k);
  }

  class lifecycle_error: public std::runtime_error
  {
  public:
    lifecycle_error (error_kind k, const std::string& what)
      : std::runtime_error (what), kind_ (k) {}

    error_kind
    kind () const noexcept
    {
      return kind_;
    }

  private:
    error_kind kind_;
  };
}
