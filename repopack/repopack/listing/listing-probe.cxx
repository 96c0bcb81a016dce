#include <repopack/listing/listing-probe.hxx>

#include <utility>

using namespace std;

namespace repopack
{
  ostream&
  operator<< (ostream& o, probe_state s)
  {
    switch (s)
    {
    case probe_state::probing:   return o << "probing";
    case probe_state::resolved:  return o << "resolved";
    case probe_state::exhausted: return o << "exhausted";
    }
    return o;
  }

  string ref_probe::
  dir () const
  {
    string r;
    for (const string& s: segments)
    {
      if (!r.empty ())
        r += '/';

      r += s;
    }
    return r;
  }

  ref_probe
  make_probe (string ref, const string& dir)
  {
    ref_probe r;
    r.ref = move (ref);

    for (size_t b (0); b <= dir.size (); )
    {
      size_t e (dir.find ('/', b));
      if (e == string::npos)
        e = dir.size ();

      if (e != b)
        r.segments.push_back (dir.substr (b, e - b));

      b = e + 1;
    }

    return r;
  }

  ref_probe
  transition (const ref_probe& p, probe_outcome o)
  {
    if (p.state != probe_state::probing)
      return p;

    ref_probe r (p);
    ++r.attempts;

    if (o == probe_outcome::found)
    {
      r.state = probe_state::resolved;
      return r;
    }

    if (r.segments.empty ())
    {
      r.state = probe_state::exhausted;
      return r;
    }

    r.ref += '/';
    r.ref += r.segments.front ();
    r.segments.erase (r.segments.begin ());

    return r;
  }
}
