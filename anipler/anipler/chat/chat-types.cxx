#include <anipler/chat/chat-types.hxx>

#include <stdexcept>

using namespace std;

namespace anipler
{
  optional<chat_command>
  parse_command (const string& text)
  {
    size_t b (text.find_first_not_of (" \t\n"));

    if (b == string::npos || text[b] != '/')
      return nullopt;

    size_t e (text.find_first_of (" \t\n", b));

    chat_command c;
    c.name = text.substr (b + 1, e == string::npos ? string::npos : e - b - 1);

    if (size_t a = c.name.find ('@'); a != string::npos)
      c.name.resize (a);

    if (c.name.empty ())
      return nullopt;

    if (e != string::npos)
    {
      size_t ab (text.find_first_not_of (" \t\n", e));
      size_t ae (text.find_last_not_of (" \t\n"));

      if (ab != string::npos)
        c.argument = text.substr (ab, ae - ab + 1);
    }

    return c;
  }

  vector<chat_message>
  parse_updates (const json::value& v)
  {
    if (!v.is_object ())
      throw invalid_argument ("getUpdates answer is not an object");

    const json::object& o (v.get_object ());
    const json::value* ok (o.if_contains ("ok"));

    if (ok == nullptr || !ok->is_bool () || !ok->get_bool ())
    {
      const json::value* d (o.if_contains ("description"));
      throw invalid_argument (
        "getUpdates failed" +
        (d != nullptr && d->is_string ()
         ? ": " + json::value_to<string> (*d)
         : string ()));
    }

    const json::value* r (o.if_contains ("result"));

    if (r == nullptr || !r->is_array ())
      throw invalid_argument ("getUpdates answer has no result array");

    vector<chat_message> ms;

    for (const json::value& u: r->get_array ())
    {
      const json::value* id (u.is_object ()
                             ? u.get_object ().if_contains ("update_id")
                             : nullptr);

      if (id == nullptr || !id->is_int64 ())
        throw invalid_argument ("update without update_id");

      chat_message m;
      m.update_id = id->get_int64 ();

      if (const json::value* msg = u.get_object ().if_contains ("message");
          msg != nullptr && msg->is_object ())
      {
        const json::object& mo (msg->get_object ());

        if (const json::value* c = mo.if_contains ("chat");
            c != nullptr && c->is_object ())
        {
          if (const json::value* ci = c->get_object ().if_contains ("id");
              ci != nullptr && ci->is_int64 ())
            m.chat_id = ci->get_int64 ();
        }

        if (const json::value* t = mo.if_contains ("text");
            t != nullptr && t->is_string ())
          m.text = json::value_to<string> (*t);
      }

      ms.push_back (move (m));
    }

    return ms;
  }
}
