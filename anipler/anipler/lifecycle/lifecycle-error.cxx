#include <anipler/lifecycle/lifecycle-error.hxx>

namespace anipler
{
  std::string
  to_string (error_kind k)
  {
    switch (k)
    {
      case error_kind::conflict:           return "conflict";
      case error_kind::not_found:          return "not_found";
      case error_kind::invalid_transition: return "invalid_transition";
      case error_kind::transient:          return "transient";
      case error_kind::unauthorized:       return "unauthorized";
      case error_kind::fatal:              return "fatal";
    }
    return "fatal";
  }
}
