#include <stdexcept>

namespace repopack
{
  template <typename S>
  inline boost::json::value
  parse_json (const basic_http_response<S>& r)
  {
    if (!r.body || r.body->empty ())
      throw std::runtime_error ("empty response body");

    const S& b (*r.body);

    boost::system::error_code ec;
    boost::json::value v (boost::json::parse (b, ec));

    if (ec)
    {
      S e ("invalid JSON (" + ec.message () + ") in response body '");
      e.append (b, 0, 32);

      if (b.size () > 32)
        e += "...";

      e += '\'';
      throw std::runtime_error (e);
    }

    return v;
  }
}
