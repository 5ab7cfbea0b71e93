#include <cstring>
#include <linux/securebits.h>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/isolation/capabilities.hh>
#include <sandpool/macros/throw.hh>
#include <sys/capability.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace sandpool::capabilities {

void set_and_lock_securebits() {
    if (prctl(
            PR_SET_SECUREBITS,
            /* SECBIT_KEEP_CAPS off */
            SECBIT_KEEP_CAPS_LOCKED | SECBIT_NO_SETUID_FIXUP | SECBIT_NO_SETUID_FIXUP_LOCKED |
                SECBIT_NOROOT | SECBIT_NOROOT_LOCKED | SECBIT_NO_CAP_AMBIENT_RAISE |
                SECBIT_NO_CAP_AMBIENT_RAISE_LOCKED,
            0,
            0,
            0
        ))
    {
        THROW_AS(SetupFailure, "prctl(PR_SET_SECUREBITS)", errmsg());
    }
}

void drop_all_capabilities() {
    cap_t caps = cap_init(); // all capabilities are cleared
    if (caps == nullptr) {
        THROW_AS(SetupFailure, "cap_init()", errmsg());
    }
    int rc = cap_set_proc(caps);
    int errnum = errno;
    (void)cap_free(caps);
    if (rc) {
        THROW_AS(SetupFailure, "cap_set_proc()", errmsg(errnum));
    }
}

void set_no_new_privs() {
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0)) {
        THROW_AS(SetupFailure, "prctl(PR_SET_NO_NEW_PRIVS)", errmsg());
    }
}

void set_hostname(const char* hostname) {
    if (sethostname(hostname, std::strlen(hostname))) {
        THROW_AS(SetupFailure, "sethostname()", errmsg());
    }
}

} // namespace sandpool::capabilities
