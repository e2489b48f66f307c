#ifndef LOGGING_H
#define LOGGING_H

#include <string>

namespace Logging {

// Installs the default logger: colored stderr plus an optional file sink.
// Unknown level names fall back to "info".
void init(const std::string& level, const std::string& log_file);

// Raises the stderr threshold so console output stays readable.
void quietConsole();

} // namespace Logging

#endif // LOGGING_H
