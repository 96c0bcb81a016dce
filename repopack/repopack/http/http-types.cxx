#include <repopack/http/http-types.hxx>

#include <cctype>
#include <sstream>

using namespace std;

namespace repopack
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:  return "GET";
      case http_method::head: return "HEAD";
    }
    return "GET";
  }

  string
  to_string (http_status s)
  {
    switch (s)
    {
      case http_status::ok:                    return "OK";
      case http_status::partial_content:       return "Partial Content";
      case http_status::moved_permanently:     return "Moved Permanently";
      case http_status::found:                 return "Found";
      case http_status::see_other:             return "See Other";
      case http_status::not_modified:          return "Not Modified";
      case http_status::temporary_redirect:    return "Temporary Redirect";
      case http_status::permanent_redirect:    return "Permanent Redirect";
      case http_status::bad_request:           return "Bad Request";
      case http_status::unauthorized:          return "Unauthorized";
      case http_status::forbidden:             return "Forbidden";
      case http_status::not_found:             return "Not Found";
      case http_status::request_timeout:       return "Request Timeout";
      case http_status::too_many_requests:     return "Too Many Requests";
      case http_status::internal_server_error: return "Internal Server Error";
      case http_status::bad_gateway:           return "Bad Gateway";
      case http_status::service_unavailable:   return "Service Unavailable";
      case http_status::gateway_timeout:       return "Gateway Timeout";
    }

    return "Unknown";
  }

  bool
  header_name_equal (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i != x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  string http_version::
  string () const
  {
    ostringstream os;

    os << "HTTP/" << static_cast<unsigned> (major)
       << '.'     << static_cast<unsigned> (minor);

    return os.str ();
  }
}
