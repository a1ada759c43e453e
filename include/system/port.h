#pragma once

namespace lswitch {

// Ask the OS for a currently unused TCP port by binding port 0 on all
// interfaces. The socket is closed before returning, so the port is only
// momentarily free. Throws SwitchError(kSpawnFailure) on socket errors.
int findFreePort();

}  // namespace lswitch
