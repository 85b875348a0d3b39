#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <anipler/http/http-client.hxx>
#include <anipler/chat/chat-types.hxx>

namespace anipler
{
  namespace asio = boost::asio;

  // Telegram Bot API transport.
  //
  class telegram_transport
  {
  public:
    telegram_transport (asio::io_context& ioc,
                        std::string token,
                        std::chrono::seconds poll_timeout = std::chrono::seconds (30));

    telegram_transport (const telegram_transport&) = delete;
    telegram_transport& operator= (const telegram_transport&) = delete;

    void
    set_verbose (bool v)
    {
      verbose_ = v;
    }

    // Long-poll for updates with id at or above offset. Throws on network or
    // API failure.
    //
    asio::awaitable<std::vector<chat_message>>
    poll (std::int64_t offset);

    asio::awaitable<void>
    send (std::int64_t chat_id, const std::string& text);

    // Publish the command list for the one chat that may use it.
    //
    asio::awaitable<void>
    register_commands (std::int64_t chat_id,
                       const std::vector<chat_command_info>&);

  private:
    asio::awaitable<json::value>
    call (const std::string& method, const json::value& params);

    http_client client_;
    std::string base_;
    std::chrono::seconds poll_timeout_;
    bool verbose_ = false;
  };
}
