#ifndef UTILS_H
#define UTILS_H

#include <chrono>
#include <cstdint>
#include <string>

// A single, globally accessible error checker to be used across the project.
void check_mpv_error(int status, const std::string& context);

// Maps an identifier onto a name that is safe to use as a file name.
std::string sanitize_file_name(const std::string& value);

bool starts_with(const std::string& value, const std::string& prefix);

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms);

#endif // UTILS_H
