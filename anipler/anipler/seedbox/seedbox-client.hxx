#pragma once

#include <string>
#include <vector>
#include <optional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <anipler/http/http-client.hxx>
#include <anipler/seedbox/seedbox-types.hxx>

namespace anipler
{
  namespace asio = boost::asio;

  // qBittorrent Web API client.
  //
  // Authenticates with the WebUI credentials and keeps the SID cookie. An
  // expired session (403) is renewed once per call.
  //
  class seedbox_client
  {
  public:
    seedbox_client (asio::io_context& ioc,
                    std::string url,
                    std::string username,
                    std::string password);

    seedbox_client (const seedbox_client&) = delete;
    seedbox_client& operator= (const seedbox_client&) = delete;

    void
    set_verbose (bool v);

    // List the torrents carrying the tag.
    //
    asio::awaitable<std::vector<torrent_info>>
    list (const std::string& tag);

    // Submit a magnet link or torrent URL with the tag. Return the info hash
    // if it can be determined from the source.
    //
    asio::awaitable<std::optional<std::string>>
    add (const std::string& source, const std::string& tag);

  private:
    asio::awaitable<void>
    login ();

    // Send the request with the session cookie, logging in first if there
    // is no session or it expired.
    //
    asio::awaitable<http_response>
    call (http_request r);

    http_client client_;
    std::string url_;
    std::string username_;
    std::string password_;
    std::string cookie_;
    bool session_ = false;
    bool verbose_ = false;
  };
}
