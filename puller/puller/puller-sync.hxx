#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <filesystem>

#include <boost/asio/awaitable.hpp>

#include <anipler/transfer/transfer-types.hxx>
#include <anipler/transfer/transfer-executor.hxx>

#include <puller/puller-client.hxx>

namespace puller
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  struct sync_config
  {
    // Archive the artifacts end up in.
    //
    fs::path destination;

    // ssh endpoint to copy from instead of the one the relay names.
    //
    std::string ssh_host;

    anipler::copy_options copy;
  };

  struct sync_report
  {
    std::size_t pulled = 0;
    std::size_t skipped = 0;   // Claimed by someone else or already archived.
    std::size_t failed = 0;
    std::vector<std::string> failures;
  };

  std::string
  to_string (const sync_report&);

  // Working directory of an artifact copy, inside the destination.
  //
  fs::path
  staging_dir (const fs::path& destination, const std::string& task_id);

  // Pull every Ready artifact: claim, copy into the staging directory, move
  // into the destination, confirm.
  //
  // A failed copy leaves the claim to expire on the relay so the artifact
  // is offered again later.
  //
  asio::awaitable<sync_report>
  sync_artifacts (relay_client&, anipler::transfer_executor&, const sync_config&);
}
