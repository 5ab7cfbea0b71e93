#include <fcntl.h>
#include <sandpool/errmsg.hh>
#include <sandpool/file_contents.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/write_exact.hh>
#include <unistd.h>

std::string get_file_contents(int fd) {
    std::string res;
    char buff[8192];
    for (;;) {
        auto rc = read(fd, buff, sizeof(buff));
        if (rc == 0) {
            return res;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        res.append(buff, static_cast<size_t>(rc));
    }
}

std::string get_file_contents_at(int dirfd, const char* path) {
    FileDescriptor fd{openat(dirfd, path, O_RDONLY | O_CLOEXEC)};
    if (!fd.is_open()) {
        THROW("openat(", path, ")", errmsg());
    }
    return get_file_contents(fd);
}

std::string get_file_contents(const char* path) { return get_file_contents_at(AT_FDCWD, path); }

void write_file_at(int dirfd, const char* path, std::string_view data) {
    FileDescriptor fd{openat(dirfd, path, O_WRONLY | O_TRUNC | O_CLOEXEC)};
    if (!fd.is_open()) {
        THROW("openat(", path, ")", errmsg());
    }
    if (write_all(fd, data) != data.size()) {
        THROW("write(", path, ")", errmsg());
    }
    if (fd.close()) {
        THROW("close(", path, ")", errmsg());
    }
}
