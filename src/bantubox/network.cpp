#include "bantubox/network.h"

#include <cerrno>
#include <string>

#include "bantubox/errors.h"
#include "bantubox/options.h"

void bring_up_loopback(KernelOps& kernel) {
    if (kernel.interface_up(LOOPBACK_INTERFACE) != 0) {
        throw NetworkSetupError(errno_message(std::string("Failed to bring up ") + LOOPBACK_INTERFACE, errno));
    }
    log_debug(std::string("Interface ") + LOOPBACK_INTERFACE + " is up");
}
