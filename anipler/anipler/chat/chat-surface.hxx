#pragma once

#include <map>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <functional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <anipler/chat/chat-types.hxx>
#include <anipler/chat/chat-transport.hxx>
#include <anipler/scheduler/scheduler.hxx>

namespace anipler
{
  namespace asio = boost::asio;

  struct command_surface_config
  {
    // The only chat whose commands are accepted.
    //
    std::int64_t chat_id = 0;

    std::chrono::milliseconds backoff_floor {1000};
    std::chrono::milliseconds backoff_ceiling {60000};
  };

  // Chat command surface.
  //
  // Polls the transport for messages and runs the command found in each one
  // from the authorized chat. Every command runs in its own coroutine so a
  // slow job does not hold up the poll loop; the reply summarizes the
  // outcome.
  //
  template <typename T = telegram_transport>
  class basic_command_surface
  {
  public:
    using transport_type = T;

    // Command handler. Return the reply text.
    //
    using handler_type =
      std::function<asio::awaitable<std::string> (const std::string& argument)>;

    basic_command_surface (asio::io_context&,
                           std::shared_ptr<transport_type>,
                           command_surface_config);

    void
    set_verbose (bool v)
    {
      verbose_ = v;
    }

    void
    add_command (std::string name, std::string description, handler_type h);

    // Add a command that triggers the scheduler job of the same name.
    //
    void
    add_trigger (scheduler& s, std::string name, std::string description);

    // Register the commands, then poll until stop().
    //
    asio::awaitable<void>
    run ();

    void
    stop ();

    std::int64_t
    offset () const noexcept
    {
      return offset_;
    }

  private:
    asio::awaitable<void>
    execute (std::int64_t chat_id, chat_command c);

    void
    dispatch (const chat_message&);

    struct command_entry
    {
      std::string description;
      handler_type handler;
    };

    asio::io_context& ioc_;
    std::shared_ptr<transport_type> transport_;
    command_surface_config config_;
    std::map<std::string, command_entry> commands_;
    asio::steady_timer timer_;
    std::int64_t offset_ = 0;
    bool stopped_ = false;
    bool verbose_ = false;
  };

  using command_surface = basic_command_surface<>;
}

#include <anipler/chat/chat-surface.txx>
