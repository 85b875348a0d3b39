#pragma once

#include <chrono>
#include <string>
#include <cstdint>
#include <ostream>
#include <utility>
#include <filesystem>

namespace anipler
{
  namespace fs = std::filesystem;

  enum class transfer_status
  {
    success,
    failure,   // Copy program failed or could not be started.
    cancelled, // Timed out or not run (dry run). Safe to retry.
    busy       // Another copy owns the destination right now.
  };

  inline std::ostream&
  operator<< (std::ostream& os, transfer_status s)
  {
    switch (s)
    {
      case transfer_status::success:   return os << "success";
      case transfer_status::failure:   return os << "failure";
      case transfer_status::cancelled: return os << "cancelled";
      case transfer_status::busy:      return os << "busy";
    }
    return os;
  }

  struct transfer_outcome
  {
    transfer_status status = transfer_status::success;
    std::string reason;

    bool
    ok () const noexcept
    {
      return status == transfer_status::success;
    }

    static transfer_outcome
    success (std::string r = std::string ())
    {
      return transfer_outcome {transfer_status::success, std::move (r)};
    }

    static transfer_outcome
    failure (std::string r)
    {
      return transfer_outcome {transfer_status::failure, std::move (r)};
    }

    static transfer_outcome
    cancelled (std::string r)
    {
      return transfer_outcome {transfer_status::cancelled, std::move (r)};
    }

    static transfer_outcome
    busy (std::string r)
    {
      return transfer_outcome {transfer_status::busy, std::move (r)};
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const transfer_outcome& o)
  {
    os << o.status;

    if (!o.reason.empty ())
      os << " (" << o.reason << ')';

    return os;
  }

  struct copy_options
  {
    // Rate ceiling in KiB/s, 0 for none.
    //
    std::uint32_t rate_limit = 0;

    std::chrono::seconds connect_timeout {30};

    // Wall clock limit of the whole copy, 0 for none.
    //
    std::chrono::seconds timeout {0};

    // SSH identity file, empty for the ssh default.
    //
    std::string ssh_key;
  };

  // Copy <endpoint>:<source> (or the local source if endpoint is empty) so
  // that it ends up inside the destination directory.
  //
  struct copy_request
  {
    std::string endpoint;
    std::string source;
    fs::path destination;
    copy_options options;
  };
}
