#pragma once

#include <sandpool/worker/protocol.hh>

namespace sandpool::mounts {

/**
 * @brief Replaces the root filesystem of the calling process (which has to be the only member
 *   of a fresh mount namespace it has CAP_SYS_ADMIN in).
 * @details The new root is a small read-only tmpfs containing:
 *   - runtime paths bound read-only and executable (symlinks are recreated instead),
 *   - fs_allow paths bound according to their access mode,
 *   - /dev/null, /dev/zero and /dev/urandom,
 *   - a fresh proc at /proc if @p profile requests it,
 *   - a private writable tmpfs of work_dir_size bytes at /tmp.
 *   The old root is detached.
 *
 * @errors Throws SetupFailure
 */
void set_up_mount_namespace(const worker_protocol::Profile& profile);

} // namespace sandpool::mounts
