#include <repopack/download/download-types.hxx>

#include <utility>

using namespace std;

namespace repopack
{
  void download_result::
  record (const file_outcome& o)
  {
    switch (o.kind)
    {
    case outcome_kind::downloaded: ++downloaded;      break;
    case outcome_kind::skipped:    ++skipped;         break;
    case outcome_kind::cancelled:  ++cancelled_count; break;
    case outcome_kind::failed:
      {
        ++failed;

        if (o.failure)
          failures.push_back (*o.failure);

        break;
      }
    }
  }

  bool cancellation::
  request ()
  {
    if (flag_.exchange (true))
      return false;

    // Subscribers may subscribe or request in turn.
    //
    vector<function<void ()>> fs (move (subscribers_));
    subscribers_.clear ();

    for (const auto& f: fs)
      f ();

    return true;
  }

  void cancellation::
  subscribe (function<void ()> f)
  {
    if (requested ())
      f ();
    else
      subscribers_.push_back (move (f));
  }
}
