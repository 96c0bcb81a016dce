#include <charconv>

namespace repopack
{
  template <typename S, typename B>
  inline std::optional<std::uint64_t> basic_http_response<S, B>::
  content_length () const
  {
    auto v (get_header (string_type ("Content-Length")));

    if (!v || v->empty ())
      return std::nullopt;

    std::uint64_t n (0);

    // Note that we use std::from_chars for locale-independent parsing and
    // insist on consuming the whole value.
    //
    const char* e (v->data () + v->size ());
    auto r (std::from_chars (v->data (), e, n));

    if (r.ec == std::errc () && r.ptr == e)
      return n;

    return std::nullopt;
  }

  template <typename S, typename B>
  inline typename basic_http_response<S, B>::string_type
  basic_http_response<S, B>::
  status_line () const
  {
    string_type r (std::to_string (status_code ()));
    r += ' ';
    r += reason.empty () ? string_type (to_string (status)) : reason;
    return r;
  }
}
