#include <anipler/control/control-auth.hxx>

#include <openssl/crypto.h>

namespace anipler
{
  bool
  bearer_matches (std::string_view h, std::string_view key)
  {
    constexpr std::string_view p ("Bearer ");

    // An empty key would let an empty token in.
    //
    if (key.empty () || h.size () < p.size () || h.substr (0, p.size ()) != p)
      return false;

    std::string_view t (h.substr (p.size ()));

    // Still compare on a length mismatch so the timing does not tell the
    // key length apart from its content.
    //
    bool same (t.size () == key.size ());
    std::string_view x (same ? t : key);

    return CRYPTO_memcmp (x.data (), key.data (), key.size ()) == 0 && same;
  }
}
