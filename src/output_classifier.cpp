#include "adbpush/output_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace adbpush {

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::string trim(const std::string& text) {
  const char* ws = " \t\r\n\f\v";
  size_t begin = text.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(ws);
  return text.substr(begin, end - begin + 1);
}

bool is_success(const std::string& output) {
  if (trim(output).empty()) {
    return false;
  }
  return to_lower(output).find(ADB_ERROR_MARKER) == std::string::npos;
}

std::string first_error_line(const std::string& output) {
  std::istringstream iss(output);
  std::string line;
  while (std::getline(iss, line)) {
    if (to_lower(line).find(ADB_ERROR_MARKER) != std::string::npos) {
      return trim(line);
    }
  }
  return "";
}

}  // namespace adbpush
