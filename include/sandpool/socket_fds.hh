#pragma once

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <sandpool/file_descriptor.hh>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/uio.h>
#include <vector>

// Sends @p data with @p fds_len file descriptors attached as SCM_RIGHTS. Returns the result of
// sendmsg(2). Does not allocate memory.
template <size_t MAX_FDS_LEN>
ssize_t send_fds(
    int sock_fd, const void* data, size_t data_len, int flags, const int* fds, size_t fds_len
) noexcept {
    static_assert(MAX_FDS_LEN > 0);
    if (fds_len > MAX_FDS_LEN) {
        errno = EINVAL;
        return -1;
    }
    iovec iov = {
        .iov_base = const_cast<void*>(data),
        .iov_len = data_len,
    };
    alignas(cmsghdr) char buff[CMSG_SPACE(MAX_FDS_LEN * sizeof(int))];
    std::memset(buff, 0, sizeof(buff));
    msghdr msg = {
        .msg_name = nullptr,
        .msg_namelen = 0,
        .msg_iov = &iov,
        .msg_iovlen = 1,
        .msg_control = fds_len == 0 ? nullptr : buff,
        .msg_controllen = fds_len == 0 ? 0 : CMSG_SPACE(fds_len * sizeof(int)),
        .msg_flags = 0,
    };
    if (fds_len > 0) {
        auto cmsg = CMSG_FIRSTHDR(&msg);
        cmsg->cmsg_len = CMSG_LEN(fds_len * sizeof(int));
        cmsg->cmsg_level = SOL_SOCKET;
        cmsg->cmsg_type = SCM_RIGHTS;
        std::memcpy(CMSG_DATA(cmsg), fds, fds_len * sizeof(int));
    }

    ssize_t res;
    do {
        res = sendmsg(sock_fd, &msg, flags | MSG_NOSIGNAL);
    } while (res == -1 && errno == EINTR);
    return res;
}

// Receives up to @p data_len bytes and appends received file descriptors (opened with
// O_CLOEXEC) to @p fds. Returns the result of recvmsg(2). Truncated control data is reported as
// failure with errno == EMSGSIZE, and descriptors received so far are kept.
template <size_t MAX_FDS_LEN>
ssize_t recv_fds(
    int sock_fd, void* data, size_t data_len, int flags, std::vector<FileDescriptor>& fds
) {
    iovec iov = {
        .iov_base = data,
        .iov_len = data_len,
    };
    alignas(cmsghdr) char buff[CMSG_SPACE(MAX_FDS_LEN * sizeof(int))];
    msghdr msg = {
        .msg_name = nullptr,
        .msg_namelen = 0,
        .msg_iov = &iov,
        .msg_iovlen = 1,
        .msg_control = buff,
        .msg_controllen = sizeof(buff),
        .msg_flags = 0,
    };
    ssize_t res;
    do {
        res = recvmsg(sock_fd, &msg, flags | MSG_CMSG_CLOEXEC);
    } while (res == -1 && errno == EINTR);
    if (res < 0) {
        return res;
    }

    for (auto cmsg = CMSG_FIRSTHDR(&msg); cmsg != nullptr; cmsg = CMSG_NXTHDR(&msg, cmsg)) {
        if (cmsg->cmsg_level != SOL_SOCKET || cmsg->cmsg_type != SCM_RIGHTS) {
            continue;
        }
        size_t num = (cmsg->cmsg_len - CMSG_LEN(0)) / sizeof(int);
        for (size_t i = 0; i < num; ++i) {
            int fd;
            std::memcpy(&fd, CMSG_DATA(cmsg) + i * sizeof(int), sizeof(int));
            fds.emplace_back(fd);
        }
    }
    if (msg.msg_flags & MSG_CTRUNC) {
        errno = EMSGSIZE;
        return -1;
    }
    return res;
}
