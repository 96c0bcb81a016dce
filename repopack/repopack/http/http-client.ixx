namespace repopack
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    // Nothing older than TLS 1.2 (GitHub refuses it anyway).
    //
    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::no_tlsv1 |
                          ssl::context::no_tlsv1_1);

    if (!traits_.verify_ssl)
    {
      ssl_ctx_.set_verify_mode (ssl::verify_none);
      return;
    }

    if (traits_.ssl_cert_file.empty ())
      ssl_ctx_.set_default_verify_paths ();
    else
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);

    ssl_ctx_.set_verify_mode (ssl::verify_peer);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (const request_type& req)
  {
    return request_impl (req, 0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& url)
  {
    return request_impl (request_type (http_method::get, url), 0);
  }
}
