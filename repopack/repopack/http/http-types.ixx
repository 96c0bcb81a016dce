#include <algorithm>

namespace repopack
{
  template <typename S>
  inline typename basic_http_headers<S>::const_iterator basic_http_headers<S>::
  find (const string_type& name) const
  {
    return std::find_if (fields_.begin (), fields_.end (),
                         [&name] (const field_type& f)
                         {
                           return header_name_equal (f.name, name);
                         });
  }

  template <typename S>
  inline std::optional<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  get (const string_type& name) const
  {
    auto i (find (name));

    if (i == fields_.end ())
      return std::nullopt;

    return i->value;
  }

  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type name, string_type value)
  {
    auto i (find (name));

    if (i == fields_.end ())
    {
      add (std::move (name), std::move (value));
      return;
    }

    // Keep the position of the first one and drop the rest.
    //
    std::size_t n (i - fields_.cbegin ());
    fields_[n].value = std::move (value);

    fields_.erase (
      std::remove_if (fields_.begin () + n + 1, fields_.end (),
                      [&name] (const field_type& f)
                      {
                        return header_name_equal (f.name, name);
                      }),
      fields_.end ());
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& name)
  {
    fields_.erase (
      std::remove_if (fields_.begin (), fields_.end (),
                      [&name] (const field_type& f)
                      {
                        return header_name_equal (f.name, name);
                      }),
      fields_.end ());
  }
}
