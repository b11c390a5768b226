#pragma once

#include <string>

namespace adbpush {

constexpr const char* ADB_ERROR_MARKER = "adb: error:";

// True unless the output is blank or carries an adb error marker (any case).
bool is_success(const std::string& output);

// First line containing the error marker, trimmed. Empty if there is none.
std::string first_error_line(const std::string& output);

std::string to_lower(std::string text);
std::string trim(const std::string& text);

}  // namespace adbpush
