#include <iostream>
#include <exception>
#include <stdexcept>

#include <anipler/control/control-auth.hxx>

namespace anipler
{
  template <typename E>
  basic_control_router<E>::
  basic_control_router (std::shared_ptr<engine_type> e, std::string k)
    : engine_ (std::move (e)), key_ (std::move (k))
  {
  }

  template <typename E>
  void basic_control_router<E>::
  set_verbose (bool v)
  {
    verbose_ = v;
  }

  template <typename E>
  typename basic_control_router<E>::response_type
  basic_control_router<E>::
  handle (const request_type& r)
  {
    std::string path (r.target ().data (), r.target ().size ());
    path = path.substr (0, path.find ('?'));

    if (verbose_)
      std::cout << r.method_string () << ' ' << path << "\n";

    if (path == "/health")
    {
      json::object o;
      o["status"] = "ok";
      return json_response (http_status::ok, o, r.version ());
    }

    auto a (r.find (http::field::authorization));
    if (a == r.end () ||
        !bearer_matches (std::string_view (a->value ().data (),
                                           a->value ().size ()),
                         key_))
    {
      response_type res (json_response (
        http_status::unauthorized,
        error_body (error_kind::unauthorized, "invalid or missing token"),
        r.version ()));

      res.set (http::field::www_authenticate, "Bearer");
      return res;
    }

    // Each request stands alone: whatever goes wrong ends up in this
    // response only.
    //
    try
    {
      return dispatch (r, path);
    }
    catch (const lifecycle_error& e)
    {
      if (e.kind () != error_kind::not_found && e.kind () != error_kind::conflict)
        std::cerr << "error: " << r.method_string () << ' ' << path << ": "
                  << e.what () << std::endl;

      return json_response (status_of (e.kind ()),
                            error_body (e.kind (), e.what ()),
                            r.version ());
    }
    catch (const std::invalid_argument& e)
    {
      json::object o;
      o["error"] = "bad_request";
      o["message"] = e.what ();
      return json_response (http_status::bad_request, o, r.version ());
    }
    catch (const std::exception& e)
    {
      std::cerr << "error: " << r.method_string () << ' ' << path << ": "
                << e.what () << std::endl;

      return json_response (http_status::internal_server_error,
                            error_body (error_kind::fatal, e.what ()),
                            r.version ());
    }
  }

  template <typename E>
  typename basic_control_router<E>::response_type
  basic_control_router<E>::
  dispatch (const request_type& r, const std::string& path)
  {
    auto body = [&r] () -> json::value
    {
      boost::system::error_code ec;
      json::value v (json::parse (r.body (), ec));

      if (ec)
        throw std::invalid_argument ("invalid JSON body: " + ec.message ());

      return v;
    };

    auto method_not_allowed = [&r] ()
    {
      json::object o;
      o["error"] = "method_not_allowed";
      o["message"] = "method not allowed";
      return json_response (http_status::method_not_allowed, o, r.version ());
    };

    if (path == "/ready")
    {
      if (r.method () != http::verb::get)
        return method_not_allowed ();

      return json_response (http_status::ok,
                            serialize (engine_->ready ()),
                            r.version ());
    }

    if (path == "/claim")
    {
      if (r.method () != http::verb::post)
        return method_not_allowed ();

      std::string id (parse_task_request (body ()));
      return json_response (http_status::ok,
                            serialize (engine_->claim (id)),
                            r.version ());
    }

    if (path == "/confirm")
    {
      if (r.method () != http::verb::post)
        return method_not_allowed ();

      std::string id (parse_task_request (body ()));
      return json_response (http_status::ok,
                            serialize (engine_->confirm (id)),
                            r.version ());
    }

    return json_response (http_status::not_found,
                          error_body (error_kind::not_found,
                                      "no route for " + path),
                          r.version ());
  }
}
