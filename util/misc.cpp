#include "util/misc.hpp"

#include <cctype>
#include <ctime>
#include <iterator>
#include <mutex>
#include <random>
#include <stdexcept>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string join(const std::vector<std::string>& pieces,
                 const std::string& sep) {
  std::string ret;
  for (size_t i = 0; i < pieces.size(); i++) {
    if (i) ret += sep;
    ret += pieces[i];
  }
  return ret;
}

std::string trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && isspace(static_cast<unsigned char>(s[begin])))
    begin++;
  while (end > begin && isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(begin, end - begin);
}

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

std::string randomId(size_t length) {
  static std::mutex mutex;
  static std::mt19937_64 generator{std::random_device{}()};
  static const char* digits = "0123456789abcdef";
  std::lock_guard<std::mutex> lck(mutex);
  std::string ret(length, '0');
  for (char& c : ret) c = digits[generator() % 16];
  return ret;
}

std::string base64Decode(const std::string& data) {
  std::string ret;
  uint32_t buffer = 0;
  int bits = 0;
  size_t padding = 0;
  for (char c : data) {
    if (isspace(static_cast<unsigned char>(c))) continue;
    if (c == '=') {
      padding++;
      continue;
    }
    if (padding) throw std::invalid_argument("base64: data after padding");
    uint32_t value;
    if (c >= 'A' && c <= 'Z') {
      value = c - 'A';
    } else if (c >= 'a' && c <= 'z') {
      value = c - 'a' + 26;
    } else if (c >= '0' && c <= '9') {
      value = c - '0' + 52;
    } else if (c == '+') {
      value = 62;
    } else if (c == '/') {
      value = 63;
    } else {
      throw std::invalid_argument("base64: invalid character");
    }
    buffer = (buffer << 6) | value;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      ret += static_cast<char>((buffer >> bits) & 0xff);
    }
  }
  if (padding > 2 || bits >= 6) {
    throw std::invalid_argument("base64: truncated data");
  }
  return ret;
}

std::string isoTime(std::chrono::system_clock::time_point t) {
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  char buf[32] = {};
  strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

std::function<bool()> setBool(bool* var) {
  return [var]() {
    *var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string* var) {
  return [var](kj::StringPtr p) {
    *var = p.cStr();
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int32_t* var) {
  return [var](kj::StringPtr p) {
    *var = std::stoi(p.cStr());
    return true;
  };
};

}  // namespace util
