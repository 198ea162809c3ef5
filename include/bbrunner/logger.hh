#pragma once

#include <atomic>
#include <bbrunner/concat_tostr.hh>
#include <bbrunner/file_path.hh>
#include <cstdio>
#include <string>
#include <utility>

class Logger {
    FILE* f_;
    std::atomic<bool> opened_{false};
    std::atomic<bool> label_{true};

    void close() noexcept {
        if (opened_.exchange(false)) {
            (void)fclose(f_);
        }
    }

    bool lock() noexcept {
        if (f_ == nullptr) {
            return false;
        }
        flockfile(f_);
        return true;
    }

    void unlock() noexcept { funlockfile(f_); }

public:
    // Opens @p filename in append mode, throws on error
    explicit Logger(FilePath filename);

    // Logs to @p stream, nullptr creates a dummy logger
    explicit Logger(FILE* stream) noexcept : f_(stream) {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Opens @p filename in append mode as the log file. On error throws and leaves the current
    // stream unchanged.
    void open(FilePath filename);

    // Sets @p stream as the log stream, nullptr makes the logger a dummy
    void use(FILE* stream) noexcept {
        close();
        f_ = stream;
    }

    [[nodiscard]] int fileno() const noexcept { return ::fileno(f_); }

    [[nodiscard]] bool label() const noexcept { return label_.load(std::memory_order_relaxed); }

    bool label(bool add_label) noexcept { return label_.exchange(add_label); }

    class Appender {
        friend class Logger;

        Logger& logger_;
        bool flushed_ = true;
        bool label_;
        std::string buff_;

        template <class... Args>
        explicit Appender(Logger& logger, Args&&... args)
        : logger_(logger)
        , label_(logger.label()) {
            operator()(std::forward<Args>(args)...);
        }

    public:
        Appender(const Appender&) = delete;

        Appender(Appender&& app) noexcept
        : logger_(app.logger_)
        , flushed_(std::exchange(app.flushed_, true))
        , label_(app.label_)
        , buff_(std::move(app.buff_)) {}

        Appender& operator=(const Appender&) = delete;
        Appender& operator=(Appender&&) = delete;

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        Appender& operator()(Args&&... args) {
            back_insert(buff_, std::forward<Args>(args)...);
            flushed_ = false;
            return *this;
        }

        void flush() noexcept;

        ~Appender() { flush(); }
    };

    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    Appender operator()(Args&&... args) {
        return Appender(*this, std::forward<Args>(args)...);
    }

    ~Logger() { close(); }
};

// By default both write to stderr
inline Logger stdlog(stderr); // Standard (default) log
inline Logger errlog(stderr); // Error log
