#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <algorithm>

#include <boost/json.hpp>

namespace anipler
{
  namespace json = boost::json;

  // Inbound chat update. Updates that are not text messages carry a zero
  // chat id and no text; they still advance the poll offset.
  //
  struct chat_message
  {
    std::int64_t update_id = 0;
    std::int64_t chat_id = 0;
    std::string text;
  };

  // "/name argument" as typed in the chat.
  //
  struct chat_command
  {
    std::string name;
    std::string argument;
  };

  struct chat_command_info
  {
    std::string name;
    std::string description;
  };

  // Parse a command. Return nullopt if the text is not one. A "@botname"
  // suffix on the command name is dropped.
  //
  std::optional<chat_command>
  parse_command (const std::string& text);

  // Parse a Telegram getUpdates answer. Throw std::invalid_argument if it is
  // not a successful one.
  //
  std::vector<chat_message>
  parse_updates (const json::value&);

  // Delay before the next poll after a failure: doubles on every failure up
  // to the ceiling, back to the floor after a success.
  //
  class retry_backoff
  {
  public:
    using duration = std::chrono::milliseconds;

    explicit
    retry_backoff (duration floor = std::chrono::seconds (1),
                   duration ceiling = std::chrono::seconds (60))
      : floor_ (floor), ceiling_ (ceiling), current_ (floor) {}

    duration
    current () const noexcept
    {
      return current_;
    }

    // Record a failure. Return the delay to wait before retrying.
    //
    duration
    failure () noexcept
    {
      duration d (current_);
      current_ = std::min (current_ * 2, ceiling_);
      return d;
    }

    void
    success () noexcept
    {
      current_ = floor_;
    }

  private:
    duration floor_;
    duration ceiling_;
    duration current_;
  };
}
