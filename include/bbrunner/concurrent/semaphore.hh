#pragma once

#include <bbrunner/errmsg.hh>
#include <bbrunner/macros/throw.hh>
#include <cerrno>
#include <semaphore.h>

namespace concurrent {

class Semaphore {
    sem_t sem_{};

public:
    explicit Semaphore(unsigned value) {
        if (sem_init(&sem_, 0, value)) {
            THROW("sem_init()", errmsg());
        }
    }

    Semaphore(const Semaphore&) = delete;
    Semaphore(Semaphore&&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;
    Semaphore& operator=(Semaphore&&) = delete;

    void wait() {
        while (sem_wait(&sem_)) {
            if (errno != EINTR) {
                THROW("sem_wait()", errmsg());
            }
        }
    }

    void post() {
        if (sem_post(&sem_)) {
            THROW("sem_post()", errmsg());
        }
    }

    ~Semaphore() { (void)sem_destroy(&sem_); }
};

} // namespace concurrent
