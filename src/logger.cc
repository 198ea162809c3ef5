#include <bbrunner/errmsg.hh>
#include <bbrunner/logger.hh>
#include <bbrunner/macros/throw.hh>
#include <bbrunner/time.hh>
#include <exception>

Logger::Logger(FilePath filename) : f_(fopen(filename, "ae")), opened_(true) {
    if (f_ == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
}

void Logger::open(FilePath filename) {
    FILE* f = fopen(filename, "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
    close();
    f_ = f;
    opened_ = true;
}

void Logger::Appender::flush() noexcept {
    if (flushed_) {
        return;
    }
    if (logger_.lock()) {
        auto len = static_cast<int>(buff_.size());
        if (label_) {
            try {
                (void)fprintf(logger_.f_, "[ %s ] %.*s\n", localdate().c_str(), len, buff_.data());
            } catch (const std::exception&) {
                (void)fprintf(logger_.f_, "[ unknown time ] %.*s\n", len, buff_.data());
            }
        } else {
            (void)fprintf(logger_.f_, "%.*s\n", len, buff_.data());
        }
        (void)fflush(logger_.f_);
        logger_.unlock();
    }
    flushed_ = true;
    buff_.clear();
}
