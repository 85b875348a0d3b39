#pragma once

#include <chrono>
#include <string>
#include <cstdint>
#include <optional>
#include <functional>
#include <filesystem>

#include <anipler/anipler-options.hxx>
#include <anipler/lifecycle/lifecycle-engine.hxx>

namespace anipler
{
  namespace fs = std::filesystem;

  // Daemon settings.
  //
  struct daemon_config
  {
    fs::path storage;
    bool stateless = false;

    std::string listen_host = "127.0.0.1";
    std::uint16_t listen_port = 8080;
    std::string api_key;

    std::string qbit_url;
    std::string qbit_username;
    std::string qbit_password;

    engine_config engine;

    std::optional<std::string> bot_token;
    std::int64_t chat_id = 0;

    std::chrono::seconds pull_interval {3600};
    std::chrono::seconds transfer_interval {7200};
    std::chrono::seconds sweep_interval {900};

    bool dry_run = false;
    bool verbose = false;

    bool
    bot_enabled () const noexcept
    {
      return bot_token.has_value ();
    }
  };

  // Environment lookup. Return nullopt if the variable is unset.
  //
  using env_lookup = std::function<std::optional<std::string> (const char*)>;

  std::optional<std::string>
  process_env (const char* name);

  // Assemble the settings from the environment and the command line. Throw
  // lifecycle_error (fatal) on a missing required value or a malformed one.
  //
  daemon_config
  load_daemon_config (const options&, const env_lookup& = process_env);

  // Split <host>:<port>. Throw std::invalid_argument if malformed.
  //
  std::pair<std::string, std::uint16_t>
  parse_listen_address (const std::string&);
}
