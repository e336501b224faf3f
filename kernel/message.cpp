#include "kernel/message.hpp"

#include <chrono>
#include <stdexcept>

#include "util/misc.hpp"

namespace kernel {

std::string StringField(const nlohmann::json& obj, const char* name,
                        const std::string& fallback) {
  if (!obj.is_object()) return fallback;
  auto it = obj.find(name);
  if (it == obj.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}

int64_t IntField(const nlohmann::json& obj, const char* name,
                 int64_t fallback) {
  if (!obj.is_object()) return fallback;
  auto it = obj.find(name);
  if (it == obj.end() || !it->is_number_integer()) return fallback;
  return it->get<int64_t>();
}

Message Message::Make(const std::string& channel, const std::string& msg_type,
                      nlohmann::json content, const std::string& parent_id) {
  Message msg;
  msg.channel = channel;
  msg.msg_type = msg_type;
  msg.msg_id = util::randomId();
  msg.parent_id = parent_id;
  msg.content = std::move(content);
  return msg;
}

std::string Message::Serialize(const std::string& key) const {
  nlohmann::json doc;
  doc["channel"] = channel;
  doc["header"] = {{"msg_id", msg_id},
                   {"msg_type", msg_type},
                   {"session", key},
                   {"date", util::isoTime(std::chrono::system_clock::now())},
                   {"version", kProtocolVersion}};
  doc["parent_header"] = nlohmann::json::object();
  if (!parent_id.empty()) doc["parent_header"]["msg_id"] = parent_id;
  doc["content"] = content;
  return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool Message::Parse(const std::string& line, const std::string& key,
                    Message* msg) {
  nlohmann::json doc = nlohmann::json::parse(line, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) return false;
  auto header = doc.find("header");
  auto channel = doc.find("channel");
  if (header == doc.end() || !header->is_object() || channel == doc.end() ||
      !channel->is_string()) {
    return false;
  }
  if (StringField(*header, "session") != key) return false;
  msg->channel = channel->get<std::string>();
  msg->msg_type = StringField(*header, "msg_type");
  msg->msg_id = StringField(*header, "msg_id");
  msg->parent_id.clear();
  auto parent = doc.find("parent_header");
  if (parent != doc.end() && parent->is_object()) {
    msg->parent_id = StringField(*parent, "msg_id");
  }
  auto content = doc.find("content");
  msg->content = content != doc.end() && content->is_object()
                     ? *content
                     : nlohmann::json::object();
  return !msg->msg_type.empty();
}

std::string ConnectionInfo::ToJson() const {
  nlohmann::json doc = {{"transport", transport},
                        {"key", key},
                        {"signature_scheme", "none"},
                        {"kernel_name", kernel_name}};
  return doc.dump(2);
}

ConnectionInfo ConnectionInfo::FromJson(const std::string& text) {
  nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw std::invalid_argument("Connection file is not a JSON object");
  }
  ConnectionInfo info;
  info.transport = StringField(doc, "transport", info.transport);
  info.key = StringField(doc, "key");
  info.kernel_name = StringField(doc, "kernel_name", info.kernel_name);
  if (info.key.empty()) {
    throw std::invalid_argument("Connection file has no key");
  }
  return info;
}

}  // namespace kernel
