#include <repopack/locator/locator.hxx>

#include <vector>

#include <repopack/repopack-error.hxx>

using namespace std;

namespace repopack
{
  string repo_locator::
  anchor () const
  {
    size_t p (dir.rfind ('/'));
    return p == string::npos ? dir : dir.substr (p + 1);
  }

  string repo_locator::
  string () const
  {
    std::string r (owner + '/' + repo);

    if (ref)
      r += '@' + *ref;

    if (!dir.empty ())
      r += ':' + dir;

    return r;
  }

  repo_locator
  parse_locator (const string& s)
  {
    // Strip the scheme and authority.
    //
    string p (s);

    size_t i (p.find ("://"));
    if (i != string::npos)
    {
      size_t e (p.find ('/', i + 3));
      p = e != string::npos ? p.substr (e + 1) : string ();
    }

    p = p.substr (0, p.find_first_of ("?#"));

    // Split into segments, dropping empty ones (duplicate, leading, and
    // trailing separators).
    //
    vector<string> ss;
    for (size_t b (0); b <= p.size (); )
    {
      size_t e (p.find ('/', b));
      if (e == string::npos)
        e = p.size ();

      if (e != b)
        ss.push_back (p.substr (b, e - b));

      b = e + 1;
    }

    // Without a scheme the host may still be there (github.com/owner/repo).
    // Owner names cannot contain dots so a dotted first segment is a host.
    //
    if (i == string::npos && ss.size () > 2 &&
        ss[0].find ('.') != string::npos)
      ss.erase (ss.begin ());

    if (ss.size () < 2)
      throw invalid_locator (s, "expected owner/repo");

    repo_locator r;
    r.owner = move (ss[0]);
    r.repo = move (ss[1]);

    // Be nice to people who copy the clone URL.
    //
    if (r.repo.size () > 4 && r.repo.compare (r.repo.size () - 4, 4, ".git") == 0)
      r.repo.resize (r.repo.size () - 4);

    // A blob segment anywhere in the path means a single file view, not
    // something we can list.
    //
    for (size_t j (2); j < ss.size (); ++j)
    {
      if (ss[j] == "blob")
        throw invalid_locator (s, "points to a single file, not a directory");
    }

    size_t d (2);

    if (ss.size () > 2)
    {
      if (ss[2] == "tree")
      {
        if (ss.size () < 4)
          throw invalid_locator (s, "missing ref after 'tree'");

        r.ref = ss[3];
        d = 4;
      }
    }

    for (; d < ss.size (); ++d)
    {
      if (!r.dir.empty ())
        r.dir += '/';

      r.dir += ss[d];
    }

    return r;
  }
}
