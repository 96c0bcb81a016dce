#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace repopack
{
  namespace fs = std::filesystem;

  // Re-root a repository path at the anchor component.
  //
  // Return the suffix of path that starts with the first component equal to
  // anchor and has at least one component after it. If the only match is
  // the last component, return the empty string. Return nullopt if anchor
  // is not a component of path. Components are compared whole, so anchor
  // "doc" does not match "docs/x". An empty anchor (the repository root)
  // returns path unchanged.
  //
  std::optional<std::string>
  find_relative_path (const std::string& anchor, const std::string& path);

  // As above but throw path_traversal if the anchor is not found.
  //
  std::string
  extract_relative_path (const std::string& anchor, const std::string& path);

  // Resolve '.' and '..' lexically and drop empty components (trailing
  // separators). Never touches the filesystem.
  //
  fs::path
  normalize_path (const fs::path&);

  // Return true if the normalized target has all the normalized root's
  // components as a prefix. Both paths are expected to be either absolute
  // or relative to the same directory.
  //
  bool
  contained (const fs::path& root, const fs::path& target);

  // Derive the destination of a repository path under the output root
  // without writing anything. Throw path_traversal if the anchor is not
  // found or the result escapes the root. A path whose last component is the
  // anchor yields the root itself.
  //
  fs::path
  output_path (const std::string& anchor,
               const std::string& path,
               const fs::path& output);

  // Write the content to the destination derived as above, creating missing
  // directories and overwriting an existing file. Return the absolute path
  // written. Throw path_traversal or io_error (the latter also if the
  // destination is the root itself).
  //
  fs::path
  save_file (const std::string& anchor,
             const std::string& path,
             const std::string& content,
             const fs::path& output);
}
