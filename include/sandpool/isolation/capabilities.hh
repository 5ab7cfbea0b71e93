#pragma once

namespace sandpool::capabilities {

// Locks securebits so that neither this process nor its descendants can regain capabilities
// through setuid, exec as root or ambient capabilities. Requires CAP_SETPCAP. Throws SetupFailure.
void set_and_lock_securebits();

// Clears the effective, permitted and inheritable capability sets. Throws SetupFailure.
void drop_all_capabilities();

// Throws SetupFailure
void set_no_new_privs();

// Sets the hostname seen inside the UTS namespace. Throws SetupFailure.
void set_hostname(const char* hostname);

} // namespace sandpool::capabilities
