#pragma once

#include "bantubox/kernel.h"

constexpr const char* LOOPBACK_INTERFACE = "lo";

// Brings the loopback interface up in the calling process's network
// namespace. Throws NetworkSetupError. No veth or bridge is attached; the
// container only reaches itself.
void bring_up_loopback(KernelOps& kernel);
