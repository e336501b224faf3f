#include "kernel/kernel_client.hpp"

#include <system_error>

#include <kj/debug.h>

#include "core/errors.hpp"
#include "util/misc.hpp"

namespace kernel {

namespace {

using std::chrono::steady_clock;

std::string Seconds(std::chrono::milliseconds d) {
  return std::to_string(
      std::chrono::duration_cast<std::chrono::seconds>(d).count());
}

std::string JoinText(const nlohmann::json& text) {
  if (text.is_string()) return text.get<std::string>();
  std::string ret;
  if (text.is_array()) {
    for (const auto& line : text) {
      if (line.is_string()) ret += line.get<std::string>();
    }
  }
  return ret;
}

const nlohmann::json& Field(const nlohmann::json& obj, const char* name) {
  static const nlohmann::json kNull;
  if (!obj.is_object()) return kNull;
  auto it = obj.find(name);
  return it == obj.end() ? kNull : *it;
}

DisplayData ReadBundle(const nlohmann::json& data) {
  DisplayData bundle;
  if (!data.is_object()) return bundle;
  for (auto it = data.begin(); it != data.end(); ++it) {
    bundle.data[it.key()] = it->is_string() ? JoinText(*it) : it->dump();
  }
  return bundle;
}

}  // namespace

KernelClient::~KernelClient() { Close(); }

void KernelClient::Send(const Message& msg) {
  try {
    channel_->WriteLine(msg.Serialize(key_));
  } catch (const std::system_error& e) {
    throw core::container_start_failure(
        std::string("Interpreter exited: ") + e.what() + " " +
        util::trim(channel_->ErrorOutput()));
  }
}

bool KernelClient::Receive(Message* msg, steady_clock::time_point deadline) {
  while (true) {
    auto now = steady_clock::now();
    if (now >= deadline) return false;
    std::string line;
    auto status = channel_->ReadLine(
        &line,
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    switch (status) {
      case util::LineChannel::ReadStatus::TIMEOUT:
        return false;
      case util::LineChannel::ReadStatus::CLOSED:
        throw core::container_start_failure(
            "Interpreter exited: " + util::trim(channel_->ErrorOutput()));
      case util::LineChannel::ReadStatus::LINE:
        break;
    }
    if (Message::Parse(line, key_, msg)) return true;
    KJ_LOG(INFO, "Ignoring interpreter output", line);
  }
}

void KernelClient::Handshake(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lck(mutex_);
  auto deadline = steady_clock::now() + timeout;
  Message request = Message::Make(kShell, "kernel_info_request",
                                  nlohmann::json::object());
  Send(request);
  Message msg;
  while (Receive(&msg, deadline)) {
    if (msg.msg_type == "kernel_info_reply" &&
        msg.parent_id == request.msg_id) {
      KJ_LOG(INFO, "Kernel ready",
             StringField(msg.content, "implementation", "python"));
      return;
    }
  }
  throw core::container_start_failure(
      "Interpreter did not answer within " + Seconds(timeout) +
      "s: " + util::trim(channel_->ErrorOutput()));
}

ExecutionOutput KernelClient::Execute(const std::string& code,
                                      std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lck(mutex_);
  auto deadline = steady_clock::now() + timeout;
  Message request =
      Message::Make(kShell, "execute_request",
                    {{"code", code},
                     {"silent", false},
                     {"store_history", true},
                     {"user_expressions", nlohmann::json::object()},
                     {"allow_stdin", false},
                     {"stop_on_error", true}});
  Send(request);

  ExecutionOutput output;
  bool replied = false;
  bool idle = false;
  Message msg;
  while (!replied || !idle) {
    if (!Receive(&msg, deadline)) {
      throw core::execution_timeout("Execution did not complete within " +
                                    Seconds(timeout) + "s");
    }
    if (msg.parent_id != request.msg_id) continue;
    const nlohmann::json& content = msg.content;
    if (msg.msg_type == "execute_reply") {
      replied = true;
      output.execution_count = IntField(content, "execution_count");
      if (StringField(content, "status") == "error") output.failed = true;
    } else if (msg.msg_type == "status") {
      idle = StringField(content, "execution_state") == "idle";
    } else if (msg.msg_type == "stream") {
      std::string text = JoinText(Field(content, "text"));
      if (StringField(content, "name") == "stderr") {
        output.stderr_text += text;
      } else {
        output.stdout_text += text;
      }
    } else if (msg.msg_type == "execute_result") {
      DisplayData bundle =
          ReadBundle(Field(content, "data"));
      auto text = bundle.data.find("text/plain");
      if (text != bundle.data.end()) {
        output.has_display_value = true;
        output.display_value = text->second;
      }
      bundle.data.erase("text/plain");
      if (!bundle.data.empty()) output.displays.push_back(bundle);
    } else if (msg.msg_type == "display_data") {
      output.displays.push_back(
          ReadBundle(Field(content, "data")));
    } else if (msg.msg_type == "error") {
      output.failed = true;
      output.error_name = StringField(content, "ename");
      output.error_value = StringField(content, "evalue");
      for (const auto& line : Field(content, "traceback")) {
        if (line.is_string()) {
          output.traceback.push_back(line.get<std::string>());
        }
      }
    }
  }
  return output;
}

bool KernelClient::Ping(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lck(mutex_, std::try_to_lock);
  if (!lck.owns_lock()) return true;
  auto deadline = steady_clock::now() + timeout;
  Message ping = Message::Make(kHeartbeat, "ping", nlohmann::json::object());
  try {
    Send(ping);
    Message msg;
    while (Receive(&msg, deadline)) {
      if (msg.channel == kHeartbeat && msg.parent_id == ping.msg_id) {
        return true;
      }
    }
  } catch (const core::container_start_failure& e) {
    KJ_LOG(WARNING, "Heartbeat failed", e.what());
  }
  return false;
}

void KernelClient::Close() {
  std::lock_guard<std::mutex> lck(mutex_);
  if (channel_) channel_->Close();
}

}  // namespace kernel
