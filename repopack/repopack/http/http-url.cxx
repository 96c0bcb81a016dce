#include <repopack/http/http-url.hxx>

using namespace std;

namespace repopack
{
  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    // The authority ends at the start of the path, query, or fragment.
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
      r.host = auth;

    if (r.port.empty ())
      r.port = r.scheme == "https" ? "443" : "80";

    if (end == url.size ())
      r.target = "/";
    else if (url[end] != '/')
      r.target = '/' + url.substr (end);
    else
      r.target = url.substr (end);

    return r;
  }

  string
  url_origin (const url_parts& u)
  {
    string r (u.scheme + "://" + u.host);

    bool def ((u.scheme == "https" && u.port == "443") ||
              (u.scheme == "http" && u.port == "80"));

    if (!def)
      r += ':' + u.port;

    return r;
  }

  string
  percent_encode (const string& s, bool keep_slash)
  {
    static const char hex[] = "0123456789ABCDEF";

    string r;
    r.reserve (s.size ());

    for (char c: s)
    {
      unsigned char u (static_cast<unsigned char> (c));

      bool unreserved ((u >= 'A' && u <= 'Z') ||
                       (u >= 'a' && u <= 'z') ||
                       (u >= '0' && u <= '9') ||
                       u == '-' || u == '.' || u == '_' || u == '~');

      if (unreserved || (keep_slash && u == '/'))
        r += c;
      else
      {
        r += '%';
        r += hex[u >> 4];
        r += hex[u & 0x0F];
      }
    }

    return r;
  }

  static int
  hex_value (char c)
  {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  string
  percent_decode (const string& s)
  {
    string r;
    r.reserve (s.size ());

    for (size_t i (0); i != s.size (); ++i)
    {
      if (s[i] == '%' && i + 2 < s.size ())
      {
        int h (hex_value (s[i + 1]));
        int l (hex_value (s[i + 2]));

        if (h >= 0 && l >= 0)
        {
          r += static_cast<char> (h * 16 + l);
          i += 2;
          continue;
        }
      }

      r += s[i];
    }

    return r;
  }
}
