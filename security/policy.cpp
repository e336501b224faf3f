#include "security/policy.hpp"

#include <cctype>
#include <stdexcept>

#include "nlohmann/json.hpp"

#include "util/file.hpp"

namespace security {

namespace {

template <typename Container>
void ReadStrings(const nlohmann::json& doc, const char* key,
                 Container* out) {
  if (!doc.count(key)) return;
  const nlohmann::json& list = doc[key];
  if (!list.is_array()) {
    throw std::invalid_argument(std::string(key) + " must be a list");
  }
  out->clear();
  for (const auto& item : list) {
    if (!item.is_string()) {
      throw std::invalid_argument(std::string(key) +
                                  " must contain only strings");
    }
    out->insert(out->end(), item.get<std::string>());
  }
}

void ReadBool(const nlohmann::json& doc, const char* key, bool* out) {
  if (!doc.count(key)) return;
  if (!doc[key].is_boolean()) {
    throw std::invalid_argument(std::string(key) + " must be a boolean");
  }
  *out = doc[key].get<bool>();
}

}  // namespace

std::string NormalizePackageName(const std::string& name) {
  std::string ret;
  for (char c : name) {
    if (c == '_' || c == '.' || c == '-') {
      if (ret.empty() || ret.back() != '-') ret += '-';
    } else {
      ret += tolower(static_cast<unsigned char>(c));
    }
  }
  return ret;
}

Policy Policy::Default() {
  Policy policy;
  policy.allowed_packages = {
      "indsl",    "numpy",        "pandas",       "matplotlib",
      "seaborn",  "scikit-learn", "requests",     "beautifulsoup4",
      "pillow",   "nltk",         "opencv-python", "prophet",
      "scipy",    "stumpy",       "tensorflow",   "torch",
      "transformers"};
  policy.forbidden_modules = {"sys",    "subprocess", "multiprocessing",
                              "socket", "pickle",     "marshal",
                              "shelve", "pty",        "pdb",
                              "os",     "ctypes",     "importlib"};
  policy.forbidden_builtins = {"eval",   "exec",   "globals",
                               "locals", "compile", "__import__"};
  policy.forbidden_attributes = {"os.system",  "os.popen",   "os.fork",
                                 "os.forkpty", "os.exec*",   "os.spawn*",
                                 "os.dup2",    "os.kill",    "os.killpg",
                                 "posix.*",    "shutil.rmtree"};
  policy.allowed_shell_commands = {"pip",    "conda",  "jupyter", "python",
                                   "pytest", "black",  "flake8",  "mypy",
                                   "curl",   "wget"};
  return policy;
}

Policy Policy::FromJson(const std::string& text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("invalid JSON: ") + e.what());
  }
  if (!doc.is_object()) {
    throw std::invalid_argument("the policy must be a JSON object");
  }
  Policy policy = Default();
  std::set<std::string> packages;
  ReadStrings(doc, "allowed_packages", &packages);
  if (doc.count("allowed_packages")) {
    policy.allowed_packages.clear();
    for (const std::string& p : packages)
      policy.allowed_packages.insert(NormalizePackageName(p));
  }
  packages.clear();
  ReadStrings(doc, "blocked_packages", &packages);
  for (const std::string& p : packages)
    policy.blocked_packages.insert(NormalizePackageName(p));
  ReadStrings(doc, "forbidden_modules", &policy.forbidden_modules);
  ReadStrings(doc, "forbidden_builtins", &policy.forbidden_builtins);
  ReadStrings(doc, "forbidden_attributes", &policy.forbidden_attributes);
  ReadStrings(doc, "allowed_shell_commands", &policy.allowed_shell_commands);
  ReadStrings(doc, "disabled_rules", &policy.disabled_rules);
  ReadBool(doc, "permissive_packages", &policy.permissive_packages);
  ReadBool(doc, "allow_network", &policy.allow_network);
  return policy;
}

Policy Policy::Load(const std::string& path) {
  if (path.empty()) return Default();
  std::string text;
  try {
    text = util::File::ReadAll(path);
  } catch (const std::exception& e) {
    throw std::invalid_argument("cannot read " + path + ": " + e.what());
  }
  try {
    return FromJson(text);
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument(path + ": " + e.what());
  }
}

}  // namespace security
