namespace repopack
{
  template <typename S>
  inline typename basic_http_request<S>::string_type basic_http_request<S>::
  target () const
  {
    std::size_t pos (0);

    std::size_t scheme_end (url.find ("://"));
    if (scheme_end != string_type::npos)
      pos = scheme_end + 3;

    std::size_t path_start (url.find_first_of ("/?", pos));
    if (path_start == string_type::npos)
      return string_type ("/");

    if (url[path_start] == '?')
      return string_type ("/") + url.substr (path_start);

    return url.substr (path_start);
  }

  template <typename S>
  inline void basic_http_request<S>::
  normalize ()
  {
    if (has_header (string_type ("Host")))
      return;

    std::size_t pos (0);

    std::size_t scheme_end (url.find ("://"));
    if (scheme_end != string_type::npos)
      pos = scheme_end + 3;

    // Keep an explicit port: the Host header must repeat it.
    //
    std::size_t host_end (url.find_first_of ("/?#", pos));
    if (host_end == string_type::npos)
      host_end = url.size ();

    string_type host (url.substr (pos, host_end - pos));
    if (!host.empty ())
      set_header (string_type ("Host"), std::move (host));
  }
}
