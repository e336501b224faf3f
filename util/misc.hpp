#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <chrono>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

std::string join(const std::vector<std::string>& pieces,
                 const std::string& sep);

// Removes leading and trailing whitespace.
std::string trim(const std::string& s);

bool startsWith(const std::string& s, const std::string& prefix);

// Returns a random lowercase hexadecimal string of the given length, suitable
// as an opaque identifier.
std::string randomId(size_t length = 32);

// Decodes standard base64, ignoring whitespace. Throws std::invalid_argument
// on malformed input.
std::string base64Decode(const std::string& data);

// Formats a time point as an ISO-8601 UTC timestamp.
std::string isoTime(std::chrono::system_clock::time_point t);

std::function<bool()> setBool(bool* var);
std::function<bool(kj::StringPtr)> setString(std::string* var);
std::function<bool(kj::StringPtr)> setInt(int32_t* var);

}  // namespace util
#endif
