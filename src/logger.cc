#include <sandpool/errmsg.hh>
#include <sandpool/logger.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/time.hh>

Logger::Logger(const char* path) : f_(fopen(path, "ae")), owns_f_(true) {
    if (f_ == nullptr) {
        THROW("fopen('", path, "')", errmsg());
    }
}

void Logger::open(const char* path) {
    FILE* f = fopen(path, "ae");
    if (f == nullptr) {
        THROW("fopen('", path, "')", errmsg());
    }
    close();
    f_ = f;
    owns_f_ = true;
}

void Logger::Appender::flush() noexcept {
    if (flushed_) {
        return;
    }
    flushed_ = true;
    FILE* f = logger_.f_;
    if (f == nullptr) {
        buff_.clear();
        return;
    }

    flockfile(f);
    if (logger_.label()) {
        try {
            (void)fprintf(f, "[ %s ] ", local_datetime().c_str());
        } catch (const std::exception&) {
            (void)fputs("[ unknown time ] ", f);
        }
    }
    (void)fwrite(buff_.data(), 1, buff_.size(), f);
    (void)fputc('\n', f);
    (void)fflush(f);
    funlockfile(f);
    buff_.clear();
}
