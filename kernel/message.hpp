#ifndef KERNEL_MESSAGE_HPP
#define KERNEL_MESSAGE_HPP

#include <cstdint>
#include <string>

#include "nlohmann/json.hpp"

namespace kernel {

// Channels multiplexed on the kernel's line stream.
static const constexpr char* kShell = "shell";
static const constexpr char* kIopub = "iopub";
static const constexpr char* kHeartbeat = "hb";

static const constexpr char* kProtocolVersion = "5.3";

// One envelope of the kernel protocol. On the wire every message is a single
// JSON line:
//   {"channel": ..., "header": {"msg_id", "msg_type", "session", "date",
//    "version"}, "parent_header": {"msg_id"}, "content": {...}}
// where header.session is the key of the connection.
struct Message {
  std::string channel;
  std::string msg_type;
  std::string msg_id;
  // Id of the request this message answers, empty for requests.
  std::string parent_id;
  nlohmann::json content = nlohmann::json::object();

  // A new message with a fresh id.
  static Message Make(const std::string& channel, const std::string& msg_type,
                      nlohmann::json content,
                      const std::string& parent_id = "");

  std::string Serialize(const std::string& key) const;

  // Returns false if line is not a message of the connection with the given
  // key. Interpreters may print unrelated text on the same stream.
  static bool Parse(const std::string& line, const std::string& key,
                    Message* msg);
};

// Typed field reads on interpreter JSON. A missing field or one of another
// type yields the fallback.
std::string StringField(const nlohmann::json& obj, const char* name,
                        const std::string& fallback = "");
int64_t IntField(const nlohmann::json& obj, const char* name,
                 int64_t fallback = 0);

// The connection descriptor the kernel reads at startup.
struct ConnectionInfo {
  std::string transport = "stdio";
  std::string key;
  std::string kernel_name = "python3";

  std::string ToJson() const;
  // Throws std::invalid_argument.
  static ConnectionInfo FromJson(const std::string& text);
};

}  // namespace kernel

#endif
