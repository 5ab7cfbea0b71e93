#include <ctime>
#include <sandpool/errmsg.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/time.hh>

std::string local_datetime() {
    time_t t = time(nullptr);
    if (t == static_cast<time_t>(-1)) {
        THROW("time()", errmsg());
    }
    struct tm tm;
    if (localtime_r(&t, &tm) == nullptr) {
        THROW("localtime_r()", errmsg());
    }
    char buff[32];
    auto len = strftime(buff, sizeof(buff), "%Y-%m-%d %H:%M:%S", &tm);
    if (len == 0) {
        THROW("strftime() failed");
    }
    return {buff, len};
}
