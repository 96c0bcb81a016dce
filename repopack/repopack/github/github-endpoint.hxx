#pragma once

#include <string>
#include <sstream>

namespace repopack
{
  // GitHub endpoint builder.
  //
  // The three bases are configurable so that self-hosted instances with a
  // compatible API can be used. Path components are percent-encoded
  // (keeping '/' in refs and paths), query values fully.
  //
  class github_endpoint
  {
  public:
    static constexpr const char* default_api_base   = "https://api.github.com";
    static constexpr const char* default_raw_base   = "https://raw.githubusercontent.com";
    static constexpr const char* default_media_base = "https://media.githubusercontent.com/media";

    github_endpoint ()
      : github_endpoint (default_api_base, default_raw_base, default_media_base) {}

    github_endpoint (std::string api, std::string raw, std::string media);

    // {api}/repos/{owner}/{repo}
    //
    std::string
    repo (const std::string& owner, const std::string& repo) const;

    // {api}/repos/{owner}/{repo}/git/trees/{ref}?recursive=1
    //
    std::string
    tree (const std::string& owner,
          const std::string& repo,
          const std::string& ref) const;

    // {api}/repos/{owner}/{repo}/contents[/{dir}]?ref={ref}
    //
    std::string
    contents (const std::string& owner,
              const std::string& repo,
              const std::string& dir,
              const std::string& ref) const;

    // {raw}/{owner}/{repo}/{ref}/{path}
    //
    std::string
    raw (const std::string& owner,
         const std::string& repo,
         const std::string& ref,
         const std::string& path) const;

    // {media}/{owner}/{repo}/{ref}/{path}
    //
    std::string
    media (const std::string& owner,
           const std::string& repo,
           const std::string& ref,
           const std::string& path) const;

    const std::string&
    api_base () const noexcept {return api_;}

    const std::string&
    raw_base () const noexcept {return raw_;}

    const std::string&
    media_base () const noexcept {return media_;}

  private:
    template <typename... A>
    static std::string
    build (const std::string& base, const A&... args)
    {
      std::ostringstream os;
      os << base;
      (os << ... << args);
      return os.str ();
    }

  private:
    std::string api_;
    std::string raw_;
    std::string media_;
  };
}
