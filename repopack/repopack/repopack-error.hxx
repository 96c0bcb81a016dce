#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <utility>
#include <optional>
#include <stdexcept>
#include <system_error>

namespace repopack
{
  // Error classification.
  //
  // The first group aborts the whole run (nothing usable was listed), the
  // second group is per-file and is recorded in the download result.
  //
  enum class error_kind
  {
    invalid_locator,
    auth_required,
    rate_limited,
    not_found,
    transport_failure,

    download_failed,
    path_traversal,
    io_error
  };

  std::string
  to_string (error_kind);

  inline std::ostream&
  operator<< (std::ostream& o, error_kind k)
  {
    return o << to_string (k);
  }

  // Base of all the errors we throw.
  //
  // Besides the diagnostics, each error carries its kind so that the caller
  // can map it to an outcome or exit status without a dynamic_cast ladder,
  // plus an optional hint that is printed as an info line.
  //
  class error: public std::runtime_error
  {
  public:
    error (error_kind k, const std::string& what, std::string hint = {})
      : std::runtime_error (what), kind_ (k), hint_ (std::move (hint)) {}

    error_kind
    kind () const noexcept {return kind_;}

    const std::string&
    hint () const noexcept {return hint_;}

  private:
    error_kind kind_;
    std::string hint_;
  };

  // The locator string could not be parsed.
  //
  class invalid_locator: public error
  {
  public:
    invalid_locator (std::string locator, const std::string& reason);

    const std::string&
    locator () const noexcept {return locator_;}

  private:
    std::string locator_;
  };

  // The resource is private or the credential is insufficient.
  //
  class auth_required: public error
  {
  public:
    explicit
    auth_required (const std::string& resource);
  };

  // The API quota is exhausted. The reset is whatever the server told us
  // (a unix timestamp or a number of seconds), or "unknown". If known, wait
  // is the number of seconds until the quota is replenished and ends up in
  // the hint.
  //
  class rate_limited: public error
  {
  public:
    explicit
    rate_limited (std::string reset,
                  std::optional<std::uint64_t> wait = std::nullopt);

    const std::string&
    reset () const noexcept {return reset_;}

    const std::optional<std::uint64_t>&
    wait () const noexcept {return wait_;}

  private:
    std::string reset_;
    std::optional<std::uint64_t> wait_;
  };

  class not_found: public error
  {
  public:
    not_found (std::string owner, std::string repo);

    const std::string&
    owner () const noexcept {return owner_;}

    const std::string&
    repo () const noexcept {return repo_;}

  private:
    std::string owner_;
    std::string repo_;
  };

  // Network or TLS failure, malformed payload, or an unexpected status.
  // The status is 0 if there was no response at all.
  //
  class transport_failure: public error
  {
  public:
    transport_failure (std::string url,
                       std::uint16_t status,
                       const std::string& detail);

    const std::string&
    url () const noexcept {return url_;}

    std::uint16_t
    status () const noexcept {return status_;}

  private:
    std::string url_;
    std::uint16_t status_;
  };

  class download_failed: public error
  {
  public:
    download_failed (std::string path, std::string cause);

    const std::string&
    path () const noexcept {return path_;}

    const std::string&
    cause () const noexcept {return cause_;}

  private:
    std::string path_;
    std::string cause_;
  };

  class path_traversal: public error
  {
  public:
    path_traversal (std::string path, const std::string& detail);

    const std::string&
    path () const noexcept {return path_;}

  private:
    std::string path_;
  };

  class io_error: public error
  {
  public:
    io_error (std::string path, std::error_code ec);

    const std::string&
    path () const noexcept {return path_;}

    const std::error_code&
    code () const noexcept {return code_;}

  private:
    std::string path_;
    std::error_code code_;
  };
}
