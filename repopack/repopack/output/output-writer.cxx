#include <repopack/output/output-writer.hxx>

#include <cerrno>
#include <vector>
#include <fstream>
#include <system_error>

#include <repopack/repopack-error.hxx>

using namespace std;

namespace repopack
{
  optional<string>
  find_relative_path (const string& anchor, const string& path)
  {
    if (anchor.empty ())
      return path;

    // Repository paths always use forward slashes.
    //
    vector<string> cs;
    for (size_t b (0); b <= path.size (); )
    {
      size_t e (path.find ('/', b));
      if (e == string::npos)
        e = path.size ();

      string c (path, b, e - b);
      if (!c.empty () && c != ".")
        cs.push_back (move (c));

      b = e + 1;
    }

    size_t n (cs.size ());

    for (size_t i (0); i + 1 < n; ++i)
    {
      if (cs[i] == anchor)
      {
        string r (cs[i]);
        for (size_t j (i + 1); j != n; ++j)
        {
          r += '/';
          r += cs[j];
        }
        return r;
      }
    }

    if (n != 0 && cs[n - 1] == anchor)
      return string ();

    return nullopt;
  }

  string
  extract_relative_path (const string& anchor, const string& path)
  {
    optional<string> r (find_relative_path (anchor, path));

    if (!r)
      throw path_traversal (path,
                            "directory '" + anchor + "' is not a component");

    return move (*r);
  }

  fs::path
  normalize_path (const fs::path& p)
  {
    fs::path r;

    for (const fs::path& c: p.lexically_normal ())
    {
      if (!c.empty () && c != ".")
        r /= c;
    }

    return r;
  }

  bool
  contained (const fs::path& root, const fs::path& target)
  {
    fs::path r (normalize_path (root));
    fs::path t (normalize_path (target));

    auto ti (t.begin ());
    for (auto ri (r.begin ()); ri != r.end (); ++ri, ++ti)
    {
      if (ti == t.end () || *ri != *ti)
        return false;
    }

    // What remains is normalized so any '..' left climbs above the root.
    // This can only happen with relative paths.
    //
    for (; ti != t.end (); ++ti)
    {
      if (*ti == "..")
        return false;
    }

    return true;
  }

  fs::path
  output_path (const string& anchor, const string& path, const fs::path& output)
  {
    string rel (extract_relative_path (anchor, path));

    fs::path root (normalize_path (fs::absolute (output)));
    fs::path full (normalize_path (root / fs::path (rel)));

    if (!contained (root, full))
      throw path_traversal (path, "resolves outside " + root.string ());

    return full;
  }

  fs::path
  save_file (const string& anchor,
             const string& path,
             const string& content,
             const fs::path& output)
  {
    fs::path f (output_path (anchor, path, output));

    // A file named after the anchor itself leaves nothing to name it with
    // under the output directory.
    //
    if (f == normalize_path (fs::absolute (output)))
      throw io_error (f.string (), make_error_code (errc::is_a_directory));

    fs::path d (f.parent_path ());

    error_code ec;
    fs::create_directories (d, ec);

    if (ec)
      throw io_error (d.string (), ec);

    ofstream ofs (f, ios::binary | ios::trunc);

    if (!ofs)
      throw io_error (f.string (), error_code (errno, generic_category ()));

    ofs.write (content.data (), static_cast<streamsize> (content.size ()));
    ofs.close ();

    if (!ofs)
      throw io_error (f.string (), error_code (errno, generic_category ()));

    return f;
  }
}
