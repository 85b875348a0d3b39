#include <anipler/seedbox/seedbox-client.hxx>

#include <iostream>
#include <stdexcept>

#include <anipler/http/http-json.hxx>
#include <anipler/lifecycle/lifecycle-error.hxx>

using namespace std;

namespace anipler
{
  namespace json = boost::json;

  static http_client_traits<>
  seedbox_traits ()
  {
    http_client_traits<> t;
    t.connect_timeout = 15000;
    t.request_timeout = 60000;

    // Seedbox WebUIs commonly sit behind self-signed certificates.
    //
    t.verify_ssl = false;
    return t;
  }

  seedbox_client::
  seedbox_client (asio::io_context& ioc, string url, string u, string p)
    : client_ (ioc, seedbox_traits ()),
      url_ (move (url)),
      username_ (move (u)),
      password_ (move (p))
  {
    while (!url_.empty () && url_.back () == '/')
      url_.pop_back ();
  }

  void seedbox_client::
  set_verbose (bool v)
  {
    verbose_ = v;
  }

  asio::awaitable<void> seedbox_client::
  login ()
  {
    http_request r (http_method::post, url_ + "/api/v2/auth/login");
    r.set_content_type ("application/x-www-form-urlencoded");
    r.set_header ("Referer", url_);
    r.set_body (form_encode ({{"username", username_},
                              {"password", password_}}));
    r.normalize ();

    http_response res (co_await client_.request (r));

    // The WebUI bans the client address after repeated failures.
    //
    if (res.status == http_status::forbidden)
      throw lifecycle_error (error_kind::fatal,
                             "seedbox refused login (address banned?)");

    if (!res.is_success ())
      throw lifecycle_error (error_kind::transient,
                             "seedbox login failed with status " +
                             to_string (res.status_code ()));

    if (res.text ().rfind ("Fails", 0) == 0)
      throw lifecycle_error (error_kind::fatal,
                             "seedbox rejected the credentials");

    cookie_.clear ();
    for (const string& c: res.headers.get_all ("Set-Cookie"))
    {
      if (c.rfind ("SID=", 0) == 0)
      {
        cookie_ = c.substr (0, c.find (';'));
        break;
      }
    }

    // No cookie is fine when the WebUI bypasses authentication for our
    // address.
    //
    session_ = true;

    if (verbose_)
      cout << "logged in to seedbox " << url_ << "\n";
  }

  asio::awaitable<http_response> seedbox_client::
  call (http_request r)
  {
    if (!session_)
      co_await login ();

    for (int i (0);; ++i)
    {
      http_request q (r);
      q.set_header ("Referer", url_);

      if (!cookie_.empty ())
        q.set_header ("Cookie", cookie_);

      q.normalize ();

      http_response res (co_await client_.request (q));

      if (res.status == http_status::forbidden && i == 0)
      {
        session_ = false;
        co_await login ();
        continue;
      }

      co_return res;
    }
  }

  asio::awaitable<vector<torrent_info>> seedbox_client::
  list (const string& tag)
  {
    http_request r (http_method::get,
                    url_ + "/api/v2/torrents/info?tag=" + url_encode (tag));

    http_response res (co_await call (move (r)));

    if (!res.is_success ())
      throw lifecycle_error (error_kind::transient,
                             "seedbox torrent list failed with status " +
                             to_string (res.status_code ()));

    vector<torrent_info> ts;

    try
    {
      json::value v (parse_json (res));

      if (!v.is_array ())
        throw invalid_argument ("torrent list is not an array");

      for (const json::value& e: v.get_array ())
        ts.push_back (parse_torrent_info (e));
    }
    catch (const exception& e)
    {
      throw lifecycle_error (error_kind::transient,
                             string ("invalid seedbox response: ") + e.what ());
    }

    if (verbose_)
      cout << "seedbox lists " << ts.size () << " torrents tagged "
           << tag << "\n";

    co_return ts;
  }

  asio::awaitable<optional<string>> seedbox_client::
  add (const string& source, const string& tag)
  {
    const string b ("anipler-form-boundary-4d1c7e");
    string body;

    auto part = [&body, &b] (const string& n, const string& v)
    {
      body += "--" + b + "\r\n";
      body += "Content-Disposition: form-data; name=\"" + n + "\"\r\n\r\n";
      body += v + "\r\n";
    };

    part ("urls", source);
    part ("tags", tag);
    body += "--" + b + "--\r\n";

    http_request r (http_method::post, url_ + "/api/v2/torrents/add");
    r.set_content_type ("multipart/form-data; boundary=" + b);
    r.set_body (move (body));

    http_response res (co_await call (move (r)));

    if (!res.is_success ())
      throw lifecycle_error (error_kind::transient,
                             "seedbox refused the torrent with status " +
                             to_string (res.status_code ()));

    if (res.text ().rfind ("Fails", 0) == 0)
      throw lifecycle_error (error_kind::conflict,
                             "seedbox refused the torrent: " + source);

    co_return magnet_hash (source);
  }
}
