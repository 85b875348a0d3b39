#include <iostream>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace anipler
{
  template <typename T>
  basic_command_surface<T>::
  basic_command_surface (asio::io_context& ioc,
                         std::shared_ptr<transport_type> t,
                         command_surface_config c)
    : ioc_ (ioc),
      transport_ (std::move (t)),
      config_ (c),
      timer_ (ioc)
  {
  }

  template <typename T>
  void basic_command_surface<T>::
  add_command (std::string n, std::string d, handler_type h)
  {
    commands_[std::move (n)] = command_entry {std::move (d), std::move (h)};
  }

  template <typename T>
  void basic_command_surface<T>::
  add_trigger (scheduler& s, std::string n, std::string d)
  {
    auto h = [&s, n] (const std::string&) -> asio::awaitable<std::string>
    {
      job_report r (co_await s.trigger (n));
      co_return r.ok ? r.summary : n + " failed: " + r.summary;
    };

    add_command (n, std::move (d), std::move (h));
  }

  template <typename T>
  asio::awaitable<void> basic_command_surface<T>::
  run ()
  {
    std::vector<chat_command_info> cs;
    for (const auto& [n, e]: commands_)
      cs.push_back (chat_command_info {n, e.description});

    // Without the list the commands still work, they are just not
    // suggested.
    //
    try
    {
      co_await transport_->register_commands (config_.chat_id, cs);
    }
    catch (const std::exception& e)
    {
      std::cerr << "warning: unable to register chat commands: " << e.what ()
                << std::endl;
    }

    retry_backoff b (config_.backoff_floor, config_.backoff_ceiling);

    while (!stopped_)
    {
      std::vector<chat_message> ms;
      bool failed (false);

      try
      {
        ms = co_await transport_->poll (offset_);
        b.success ();
      }
      catch (const std::exception& e)
      {
        std::cerr << "error: chat poll failed: " << e.what () << std::endl;
        failed = true;
      }

      if (stopped_)
        break;

      if (failed)
      {
        timer_.expires_after (b.failure ());

        boost::system::error_code ec;
        co_await timer_.async_wait (
          asio::redirect_error (asio::use_awaitable, ec));
        continue;
      }

      for (const chat_message& m: ms)
      {
        if (m.update_id >= offset_)
          offset_ = m.update_id + 1;

        dispatch (m);
      }
    }

    if (verbose_)
      std::cout << "chat poll loop stopped\n";
  }

  template <typename T>
  void basic_command_surface<T>::
  stop ()
  {
    stopped_ = true;
    timer_.cancel ();
  }

  template <typename T>
  void basic_command_surface<T>::
  dispatch (const chat_message& m)
  {
    // Anyone else gets no answer at all.
    //
    if (m.chat_id != config_.chat_id)
    {
      if (verbose_ && m.chat_id != 0)
        std::cout << "ignoring message from chat " << m.chat_id << "\n";
      return;
    }

    std::optional<chat_command> c (parse_command (m.text));

    if (!c)
      return;

    std::cout << "chat command /" << c->name
              << (c->argument.empty () ? "" : " " + c->argument) << std::endl;

    asio::co_spawn (ioc_, execute (m.chat_id, std::move (*c)), asio::detached);
  }

  template <typename T>
  asio::awaitable<void> basic_command_surface<T>::
  execute (std::int64_t chat_id, chat_command c)
  {
    std::string reply;

    auto i (commands_.find (c.name));

    if (i == commands_.end ())
    {
      reply = "Unknown command /" + c.name + ". Available:";
      for (const auto& [n, e]: commands_)
        reply += "\n/" + n + " - " + e.description;
    }
    else
    {
      try
      {
        reply = co_await i->second.handler (c.argument);
      }
      catch (const std::exception& e)
      {
        std::cerr << "error: /" << c.name << ": " << e.what () << std::endl;
        reply = "/" + c.name + " failed: " + e.what ();
      }
    }

    try
    {
      co_await transport_->send (chat_id, reply);
    }
    catch (const std::exception& e)
    {
      std::cerr << "error: unable to send chat reply: " << e.what ()
                << std::endl;
    }
  }
}
