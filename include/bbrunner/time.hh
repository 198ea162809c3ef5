#pragma once

#include <string>

// Returns current local date in format "YYYY-MM-DD HH:MM:SS". Throws on error.
std::string localdate();
