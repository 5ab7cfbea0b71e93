#include <cerrno>
#include <sandpool/errmsg.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/write_exact.hh>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

bool is_socket(int fd) noexcept {
    struct stat st;
    return fstat(fd, &st) == 0 && S_ISSOCK(st.st_mode);
}

} // namespace

size_t write_all(int fd, const void* buf, size_t len) noexcept {
    bool sock = is_socket(fd);
    size_t pos = 0;
    errno = 0;
    while (pos < len) {
        auto rc = sock ? send(fd, static_cast<const char*>(buf) + pos, len - pos, MSG_NOSIGNAL)
                       : write(fd, static_cast<const char*>(buf) + pos, len - pos);
        if (rc >= 0) {
            pos += static_cast<size_t>(rc);
        } else if (errno != EINTR) {
            break;
        }
    }
    return pos;
}

void write_exact(int fd, const void* buf, size_t len) {
    if (write_all(fd, buf, len) != len) {
        THROW("write()", errmsg());
    }
}
