#include "Utils.h"

#include <mpv/client.h>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept> // Required for std::runtime_error

#include "Errors.h"

void check_mpv_error(int status, const std::string& context) {
    if (status < 0) {
        std::string error_msg = "MPV Error (" + context + "): " + mpv_error_string(status);
        throw std::runtime_error(error_msg);
    }
}

const char* to_string(MediaErrorKind kind) {
    switch (kind) {
    case MediaErrorKind::Timeout:
        return "timeout";
    case MediaErrorKind::Network:
        return "network";
    case MediaErrorKind::Unsupported:
        return "unsupported";
    }
    return "unknown";
}

std::string sanitize_file_name(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            escaped << c;
            continue;
        }
        escaped << std::uppercase;
        escaped << '%' << std::setw(2) << int((unsigned char) c);
        escaped << std::nouppercase;
    }

    std::string result = escaped.str();
    return result.empty() ? "_" : result;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}
