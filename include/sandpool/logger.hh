#pragma once

#include <atomic>
#include <cstdio>
#include <sandpool/concat_tostr.hh>
#include <string>
#include <utility>

class Logger {
    FILE* f_;
    bool owns_f_ = false;
    std::atomic<bool> label_{true};

    void close() noexcept {
        if (owns_f_ && f_ != nullptr) {
            (void)fclose(f_);
        }
        owns_f_ = false;
    }

public:
    // Opens @p path in append mode, throws upon failure
    explicit Logger(const char* path);

    // nullptr creates a dummy logger that discards everything
    explicit Logger(FILE* stream) noexcept : f_(stream) {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    ~Logger() { close(); }

    /**
     * @brief Opens file @p path in append mode and logs to it from now on. Upon error an
     *   exception is thrown and the log stream is unchanged.
     */
    void open(const char* path);

    // Logs to @p stream from now on, nullptr makes the logger a dummy
    void use(FILE* stream) noexcept {
        close();
        f_ = stream;
    }

    // Sets @p stream as the log stream and returns the previous one (not closing it)
    FILE* exchange_log_stream(FILE* stream) noexcept {
        owns_f_ = false;
        return std::exchange(f_, stream);
    }

    // Whether lines are prefixed with the date and time
    [[nodiscard]] bool label() const noexcept { return label_.load(std::memory_order_relaxed); }

    bool label(bool add_label) noexcept { return label_.exchange(add_label); }

    // Collects one log line and writes it out upon flush() or destruction
    class Appender {
        friend class Logger;

        Logger& logger_;
        std::string buff_;
        bool flushed_ = true;

        explicit Appender(Logger& logger) noexcept : logger_(logger) {}

    public:
        Appender(const Appender&) = delete;
        Appender& operator=(const Appender&) = delete;
        Appender& operator=(Appender&&) = delete;

        Appender(Appender&& other) noexcept
        : logger_(other.logger_)
        , buff_(std::move(other.buff_))
        , flushed_(std::exchange(other.flushed_, true)) {}

        template <class... Args>
        Appender& operator()(Args&&... args) {
            back_insert(buff_, std::forward<Args>(args)...);
            flushed_ = false;
            return *this;
        }

        template <class T>
        Appender& operator<<(T&& x) {
            return operator()(std::forward<T>(x));
        }

        void flush() noexcept;

        ~Appender() { flush(); }
    };

    template <class... Args>
    Appender operator()(Args&&... args) {
        Appender app{*this};
        app(std::forward<Args>(args)...);
        return app;
    }
};

// Both write to stderr by default
inline Logger stdlog(stderr); // Standard (default) log
inline Logger errlog(stderr); // Error log
