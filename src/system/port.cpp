#include "system/port.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "core/switch_error.h"

namespace lswitch {

int findFreePort() {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw SwitchError(SwitchErrorCode::kSpawnFailure,
                          std::string("socket failed: ") + std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = 0;

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        const std::string msg = std::string("bind failed: ") + std::strerror(errno);
        ::close(fd);
        throw SwitchError(SwitchErrorCode::kSpawnFailure, msg);
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        const std::string msg = std::string("getsockname failed: ") + std::strerror(errno);
        ::close(fd);
        throw SwitchError(SwitchErrorCode::kSpawnFailure, msg);
    }

    ::close(fd);
    return ntohs(addr.sin_port);
}

}  // namespace lswitch
