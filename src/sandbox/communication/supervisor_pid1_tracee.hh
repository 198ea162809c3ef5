#pragma once

#include <bbrunner/concat_tostr.hh>
#include <bbrunner/sandbox/sandbox.hh>
#include <bbrunner/sandbox/si.hh>
#include <cstdint>
#include <cstring>
#include <exception>
#include <new>
#include <string>
#include <type_traits>
#include <variant>

namespace sandbox::communication::supervisor_pid1_tracee {

static constexpr auto shared_mem_state_sizeof = 4096;

struct SharedMemState {
    enum class Kind : int32_t {
        NONE,
        OK,
        ERROR,
    };

    Kind kind;
    int32_t si_code;
    int32_t si_status;
    result::Error::Stage error_stage;
    int32_t errnum;
    uint32_t error_len;
    char error_description[shared_mem_state_sizeof - sizeof(int32_t) * 6];
};

static_assert(sizeof(SharedMemState) == shared_mem_state_sizeof);
static_assert(sizeof(result::Error::Stage) == sizeof(int32_t));

inline volatile SharedMemState* initialize(void* shared_mem_state_raw) noexcept {
    if (reinterpret_cast<std::uintptr_t>(shared_mem_state_raw) % alignof(SharedMemState) != 0) {
        std::terminate();
    }
    static_assert(
        std::is_trivially_destructible_v<SharedMemState>, "This value won't be destructed"
    );
    return new (shared_mem_state_raw) SharedMemState{
        .kind = SharedMemState::Kind::NONE,
        .si_code = 0,
        .si_status = 0,
        .error_stage = result::Error::Stage::INTERNAL,
        .errnum = 0,
        .error_len = 0,
        .error_description = {},
    };
}

inline bool is_error(volatile const SharedMemState* shared_mem_state) noexcept {
    return shared_mem_state->kind == SharedMemState::Kind::ERROR;
}

inline void write_result_ok(volatile SharedMemState* shared_mem_state, const Si& si) noexcept {
    shared_mem_state->si_code = si.code;
    shared_mem_state->si_status = si.status;
    shared_mem_state->kind = SharedMemState::Kind::OK;
}

// Async-signal-safe
template <class... Args>
void write_result_error(
    volatile SharedMemState* shared_mem_state,
    result::Error::Stage stage,
    int errnum,
    Args&&... msg
) noexcept {
    size_t bytes_written = 0;
    auto append = [&](auto&& str) noexcept {
        size_t len = string_length(str);
        const char* data = string_data(str);
        for (size_t i = 0; i < len && bytes_written < sizeof(SharedMemState::error_description);
             ++i)
        {
            shared_mem_state->error_description[bytes_written++] = data[i];
        }
    };
    (append(stringify(std::forward<Args>(msg))), ...);
    shared_mem_state->error_len = static_cast<uint32_t>(bytes_written);
    shared_mem_state->error_stage = stage;
    shared_mem_state->errnum = errnum;
    shared_mem_state->kind = SharedMemState::Kind::ERROR;
}

struct None {};

// Returns None iff neither pid1 nor tracee has written the result
inline std::variant<result::Ok, result::Error, None>
read_result(volatile const SharedMemState* shared_mem_state) {
    switch (shared_mem_state->kind) {
    case SharedMemState::Kind::NONE: return None{};
    case SharedMemState::Kind::OK:
        return result::Ok{
            .si =
                {
                    .code = shared_mem_state->si_code,
                    .status = shared_mem_state->si_status,
                },
            .runtime = {},
            .termination = result::Ok::Termination::NONE,
            .escalated_to_kill = false,
        };
    case SharedMemState::Kind::ERROR: break;
    }
    auto error_len = shared_mem_state->error_len;
    if (error_len > sizeof(SharedMemState::error_description)) {
        std::terminate(); // BUG
    }
    result::Error err = {
        .stage = shared_mem_state->error_stage,
        .errnum = shared_mem_state->errnum,
        .description = {},
    };
    err.description.reserve(error_len);
    for (size_t i = 0; i < error_len; ++i) {
        err.description += shared_mem_state->error_description[i];
    }
    return err;
}

} // namespace sandbox::communication::supervisor_pid1_tracee
