#include <anipler/chat/chat-transport.hxx>

#include <iostream>
#include <stdexcept>

#include <anipler/http/http-json.hxx>
#include <anipler/lifecycle/lifecycle-error.hxx>

using namespace std;

namespace anipler
{
  static http_client_traits<>
  transport_traits (chrono::seconds poll)
  {
    http_client_traits<> t;
    t.connect_timeout = 15000;

    // The server holds getUpdates open for the poll period.
    //
    t.request_timeout =
      static_cast<uint32_t> ((poll + chrono::seconds (15)).count () * 1000);

    return t;
  }

  telegram_transport::
  telegram_transport (asio::io_context& ioc, string token, chrono::seconds p)
    : client_ (ioc, transport_traits (p)),
      base_ ("https://api.telegram.org/bot" + move (token) + '/'),
      poll_timeout_ (p)
  {
  }

  asio::awaitable<json::value> telegram_transport::
  call (const string& method, const json::value& params)
  {
    http_response r (co_await client_.request (
      make_json_request (http_method::post, base_ + method, params)));

    // The Bot API answers errors with a JSON description as well. Note that
    // the URL carries the token so never print it.
    //
    if (r.status == http_status::unauthorized)
      throw lifecycle_error (error_kind::fatal,
                             method + ": bot token rejected");

    json::value v;

    try
    {
      v = parse_json (r);
    }
    catch (const runtime_error& e)
    {
      throw lifecycle_error (error_kind::transient,
                             method + ": status " +
                             to_string (r.status_code ()) + ": " + e.what ());
    }

    co_return v;
  }

  asio::awaitable<vector<chat_message>> telegram_transport::
  poll (int64_t offset)
  {
    json::object p;
    p["offset"] = offset;
    p["timeout"] = poll_timeout_.count ();
    p["allowed_updates"] = json::array {"message"};

    json::value v (co_await call ("getUpdates", p));

    try
    {
      vector<chat_message> ms (parse_updates (v));

      if (verbose_ && !ms.empty ())
        cout << "received " << ms.size () << " chat updates\n";

      co_return ms;
    }
    catch (const invalid_argument& e)
    {
      throw lifecycle_error (error_kind::transient, e.what ());
    }
  }

  asio::awaitable<void> telegram_transport::
  send (int64_t chat_id, const string& text)
  {
    json::object p;
    p["chat_id"] = chat_id;
    p["text"] = text;

    json::value v (co_await call ("sendMessage", p));

    const json::value* ok (v.is_object ()
                           ? v.get_object ().if_contains ("ok")
                           : nullptr);

    if (ok == nullptr || !ok->is_bool () || !ok->get_bool ())
      throw lifecycle_error (error_kind::transient,
                             "sendMessage failed: " + json::serialize (v));
  }

  asio::awaitable<void> telegram_transport::
  register_commands (int64_t chat_id, const vector<chat_command_info>& cs)
  {
    json::array a;
    for (const chat_command_info& c: cs)
    {
      json::object o;
      o["command"] = c.name;
      o["description"] = c.description;
      a.push_back (move (o));
    }

    json::object scope;
    scope["type"] = "chat";
    scope["chat_id"] = chat_id;

    json::object p;
    p["commands"] = move (a);
    p["scope"] = move (scope);

    json::value v (co_await call ("setMyCommands", p));

    const json::value* ok (v.is_object ()
                           ? v.get_object ().if_contains ("ok")
                           : nullptr);

    if (ok == nullptr || !ok->is_bool () || !ok->get_bool ())
      throw lifecycle_error (error_kind::transient,
                             "setMyCommands failed: " + json::serialize (v));
  }
}
