#include <anipler/control/control-server.hxx>

namespace anipler
{
  template class basic_control_server<control_router, control_server_traits>;
}
