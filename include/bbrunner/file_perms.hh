#pragma once

#include <sys/stat.h>

constexpr inline mode_t S_0600 = S_IRUSR | S_IWUSR;
constexpr inline mode_t S_0644 = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
constexpr inline mode_t S_0700 = S_IRWXU;
constexpr inline mode_t S_0755 = S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH;
