#pragma once

#include <string_view>

namespace anipler
{
  // Return true if the Authorization header value is "Bearer <key>". The key
  // comparison takes the same time wherever the first difference is.
  //
  bool
  bearer_matches (std::string_view header, std::string_view key);
}
