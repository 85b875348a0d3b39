#pragma once

#include <string>
#include <cstdint>
#include <optional>

#include <boost/json.hpp>

#include <anipler/lifecycle/lifecycle-types.hxx>

namespace anipler
{
  // A torrent as listed by the qBittorrent Web API.
  //
  struct torrent_info
  {
    std::string hash;
    std::string name;
    std::string content_path;
    std::string state;
    double progress = 0.0;
    std::int64_t size = 0;
    std::int64_t added_on = 0; // Seconds since epoch.
  };

  // Parse one entry of /api/v2/torrents/info. Throw std::invalid_argument if
  // a member we rely on is missing or has the wrong type.
  //
  torrent_info
  parse_torrent_info (const boost::json::value&);

  // Complete downloads are seeding whatever the transfer state says
  // (paused, queued, stalled uploads are all still complete).
  //
  task_status
  status_of (const torrent_info&);

  task_fact
  to_task_fact (const torrent_info&);

  // Extract the lower-case info hash of a magnet link, if any.
  //
  std::optional<std::string>
  magnet_hash (const std::string&);
}
