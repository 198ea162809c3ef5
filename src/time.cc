#include <array>
#include <bbrunner/errmsg.hh>
#include <bbrunner/macros/throw.hh>
#include <bbrunner/time.hh>
#include <ctime>

std::string localdate() {
    time_t curr_time = time(nullptr);
    if (curr_time == static_cast<time_t>(-1)) {
        THROW("time()", errmsg());
    }
    tm tm_buff{};
    if (localtime_r(&curr_time, &tm_buff) == nullptr) {
        THROW("localtime_r()", errmsg());
    }
    std::array<char, 32> buff{};
    auto len = strftime(buff.data(), buff.size(), "%Y-%m-%d %H:%M:%S", &tm_buff);
    return {buff.data(), len};
}
