#include <puller/puller-client.hxx>

#include <iostream>
#include <stdexcept>

#include <anipler/http/http-json.hxx>
#include <anipler/lifecycle/lifecycle-error.hxx>

using namespace std;
using namespace anipler;

namespace puller
{
  relay_client::
  relay_client (asio::io_context& ioc, string url, string key)
    : client_ (ioc), url_ (move (url)), key_ (move (key))
  {
    while (!url_.empty () && url_.back () == '/')
      url_.pop_back ();
  }

  asio::awaitable<http_response> relay_client::
  call (http_request r)
  {
    r.set_bearer_token (key_);
    r.set_header ("Accept", "application/json");
    r.normalize ();

    if (verbose_)
      cout << to_string (r.method) << ' ' << r.url << "\n";

    co_return co_await client_.request (r);
  }

  void relay_client::
  fail (const string& what, const http_response& r)
  {
    error_kind k;

    switch (r.status)
    {
    case http_status::unauthorized: k = error_kind::unauthorized; break;
    case http_status::not_found:    k = error_kind::not_found;    break;
    case http_status::conflict:     k = error_kind::conflict;     break;
    default:
      k = r.is_server_error () ? error_kind::transient : error_kind::fatal;
    }

    string m (what + ": relay answered " + to_string (r.status_code ()));

    // Add the relay's own message if there is one.
    //
    try
    {
      json::value v (parse_json (r));

      if (const json::value* x = v.is_object ()
          ? v.get_object ().if_contains ("message")
          : nullptr; x != nullptr && x->is_string ())
        m += ": " + json::value_to<string> (*x);
    }
    catch (const runtime_error&)
    {
      // Not JSON (proxy error page and such).
    }

    throw lifecycle_error (k, m);
  }

  asio::awaitable<vector<ready_entry>> relay_client::
  ready ()
  {
    http_response r (
      co_await call (http_request (http_method::get, url_ + "/ready")));

    if (!r.is_success ())
      fail ("ready list", r);

    try
    {
      co_return parse_ready_list (parse_json (r));
    }
    catch (const exception& e)
    {
      throw lifecycle_error (error_kind::fatal,
                             string ("invalid ready list: ") + e.what ());
    }
  }

  asio::awaitable<optional<claim_grant>> relay_client::
  claim (const string& id)
  {
    http_response r (co_await call (
      make_json_request (http_method::post,
                         url_ + "/claim",
                         json::value (task_request (id)))));

    if (r.status == http_status::conflict)
      co_return nullopt;

    if (!r.is_success ())
      fail ("claim " + id, r);

    try
    {
      co_return parse_claim_grant (parse_json (r));
    }
    catch (const exception& e)
    {
      throw lifecycle_error (error_kind::fatal,
                             string ("invalid claim answer: ") + e.what ());
    }
  }

  asio::awaitable<optional<confirm_result>> relay_client::
  confirm (const string& id)
  {
    http_response r (co_await call (
      make_json_request (http_method::post,
                         url_ + "/confirm",
                         json::value (task_request (id)))));

    if (r.status == http_status::conflict)
      co_return nullopt;

    if (!r.is_success ())
      fail ("confirm " + id, r);

    confirm_result c;
    c.task_id = id;

    json::value v (parse_json (r));

    if (const json::value* x = v.is_object ()
        ? v.get_object ().if_contains ("reclaimed")
        : nullptr; x != nullptr && x->is_bool ())
      c.reclaimed = x->get_bool ();

    co_return c;
  }
}
