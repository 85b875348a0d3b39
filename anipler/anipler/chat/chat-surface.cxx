#include <anipler/chat/chat-surface.hxx>

namespace anipler
{
  template class basic_command_surface<telegram_transport>;
}
