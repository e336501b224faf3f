#include "security/validator.hpp"

#include <cctype>
#include <cstring>
#include <regex>
#include <set>

#include <kj/debug.h>

#include "core/errors.hpp"
#include "security/python_scanner.hpp"
#include "util/misc.hpp"

namespace security {

// The code under validation, split into shell/magic lines and Python lines.
// Magic and shell lines are blanked out of python_code so that line numbers
// are preserved.
struct Validator::Snippet {
  std::string code;
  std::string python_code;
  PythonSource source;
  bool parsed = false;
  std::string parse_error;
};

namespace {

const char* kShellOperators = ";&|`";

// Magics that run arbitrary shell code, bypassing the command allowlist.
const std::set<std::string> kShellMagics = {"%system", "%sx",    "%%bash",
                                            "%%sh",    "%%script", "%%system"};

const char* kVersionOperators[] = {"==", "!=", "<=", ">=", "~=", "<", ">"};

bool IsMagicOrShell(const std::string& stripped) {
  return !stripped.empty() && (stripped[0] == '!' || stripped[0] == '%');
}

bool SyntaxFailure(const std::string& error, std::string* message) {
  *message = "Invalid Python syntax: " + error;
  return false;
}

bool IsOutsideWorkspace(const std::string& path) {
  if (!path.empty() && path[0] == '/') return true;
  for (const std::string& piece : util::split(path, '/')) {
    if (piece == "..") return true;
  }
  return false;
}

bool IsVersionChar(char c) {
  return isalnum(static_cast<unsigned char>(c)) ||
         strchr(".*+!_-", c) != nullptr;
}

bool ParseRequirement(const std::string& requirement, Dependency* dep,
                      std::string* error) {
  if (requirement.empty()) {
    *error = "Empty package name";
    return false;
  }
  for (char c : requirement) {
    if (!IsVersionChar(c) && strchr("=<>~,", c) == nullptr) {
      *error = "Invalid package specification: " + requirement;
      return false;
    }
  }
  size_t split = requirement.find_first_of("=<>!~");
  std::string name = requirement.substr(0, split);
  if (name.empty() || !isalnum(static_cast<unsigned char>(name[0])) ||
      name.find_first_of("*+!,") != std::string::npos) {
    *error = "Invalid package name: " + requirement;
    return false;
  }
  std::string specifier;
  if (split != std::string::npos) {
    specifier = requirement.substr(split);
    for (const std::string& clause : util::split(specifier, ',')) {
      size_t op_len = 0;
      for (const char* op : kVersionOperators) {
        if (util::startsWith(clause, op)) {
          op_len = strlen(op);
          break;
        }
      }
      std::string version = op_len ? clause.substr(op_len) : "";
      bool ok = !version.empty();
      for (char c : version) ok = ok && IsVersionChar(c);
      if (!ok) {
        *error = "Invalid version specifier: " + requirement;
        return false;
      }
    }
  }
  dep->name = NormalizePackageName(name);
  dep->specifier = specifier;
  return true;
}

}  // namespace

Validator::Validator(Policy policy) : policy_(std::move(policy)) {
  rules_ = {{kJupyterCommands, &Validator::CheckJupyterCommands},
            {kDangerousBuiltins, &Validator::CheckBuiltins},
            {kDangerousImports, &Validator::CheckImports},
            {kDangerousAttributes, &Validator::CheckAttributes},
            {kDangerousPatterns, &Validator::CheckPatterns}};
  for (const auto& rule : rules_) enabled_[rule.first] = true;
  for (const std::string& name : policy_.disabled_rules) DisableRule(name);
}

void Validator::EnableRule(const std::string& name) {
  if (name == "all") {
    for (auto& rule : enabled_) rule.second = true;
  } else if (enabled_.count(name)) {
    enabled_[name] = true;
  }
}

void Validator::DisableRule(const std::string& name) {
  if (name == "all") {
    for (auto& rule : enabled_) rule.second = false;
  } else if (enabled_.count(name)) {
    enabled_[name] = false;
  }
}

bool Validator::IsRuleEnabled(const std::string& name) const {
  auto it = enabled_.find(name);
  return it != enabled_.end() && it->second;
}

ValidationResult Validator::CheckCode(const std::string& code) const {
  if (code.size() > kMaxCodeLength) {
    return {false, "Code is too long: " + std::to_string(code.size()) +
                       " characters, at most " +
                       std::to_string(kMaxCodeLength) + " are allowed"};
  }
  Snippet snippet;
  snippet.code = code;
  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= code.size()) {
    size_t end = code.find('\n', start);
    if (end == std::string::npos) end = code.size();
    lines.push_back(code.substr(start, end - start));
    start = end + 1;
  }
  for (size_t i = 0; i < lines.size(); i++) {
    if (i) snippet.python_code += '\n';
    if (!IsMagicOrShell(util::trim(lines[i]))) snippet.python_code += lines[i];
  }
  snippet.parsed =
      snippet.source.Parse(snippet.python_code, &snippet.parse_error);

  std::vector<std::string> failures;
  for (const auto& rule : rules_) {
    if (!IsRuleEnabled(rule.first)) continue;
    std::string message;
    if (!(this->*rule.second)(snippet, &message)) {
      bool duplicate = false;
      for (const std::string& f : failures) duplicate |= f == message;
      if (!duplicate) failures.push_back(message);
    }
  }
  if (!failures.empty()) return {false, util::join(failures, "; ")};
  return {true, "Code validation passed"};
}

void Validator::ValidateCode(const std::string& code) const {
  ValidationResult result = CheckCode(code);
  if (!result.valid) throw core::validation_error(result.message);
}

bool Validator::CheckJupyterCommands(const Snippet& snippet,
                                     std::string* message) const {
  for (const std::string& raw_line : util::split(snippet.code, '\n')) {
    std::string line = util::trim(raw_line);
    if (line.empty()) continue;
    if (line[0] == '!') {
      std::vector<std::string> words = util::split(line.substr(1), ' ');
      std::string command = words.empty() ? "" : util::trim(words[0]);
      if (command.empty() || !policy_.allowed_shell_commands.count(command)) {
        *message = "Shell command not allowed: " + command;
        return false;
      }
      if (line.find_first_of(kShellOperators) != std::string::npos ||
          line.find("$(") != std::string::npos) {
        *message = "Shell operators not allowed: " + line;
        return false;
      }
    } else if (line[0] == '%') {
      std::string magic = line.substr(0, line.find_first_of(" \t"));
      if (kShellMagics.count(magic)) {
        *message = "Magic command not allowed: " + magic;
        return false;
      }
    }
  }
  return true;
}

bool Validator::CheckBuiltins(const Snippet& snippet,
                              std::string* message) const {
  if (!snippet.parsed) return SyntaxFailure(snippet.parse_error, message);
  for (const PythonSource::Call& call : snippet.source.Calls()) {
    std::string name = call.callee;
    for (const char* module : {"builtins.", "__builtins__."}) {
      if (util::startsWith(name, module)) name = name.substr(strlen(module));
    }
    if (policy_.forbidden_builtins.count(name)) {
      *message = "Forbidden function call: " + call.callee;
      return false;
    }
  }
  return true;
}

bool Validator::CheckImports(const Snippet& snippet,
                             std::string* message) const {
  if (!snippet.parsed) return SyntaxFailure(snippet.parse_error, message);
  for (const std::string& module : snippet.source.Imports()) {
    std::string top = module.substr(0, module.find('.'));
    if (top == "socket" && policy_.allow_network) continue;
    if (policy_.forbidden_modules.count(top)) {
      *message = "Forbidden import: " + module;
      return false;
    }
    if (policy_.blocked_packages.count(NormalizePackageName(top))) {
      *message = "Blocked import: " + module;
      return false;
    }
  }
  return true;
}

bool Validator::IsForbiddenAttribute(const std::string& chain) const {
  for (const std::string& pattern : policy_.forbidden_attributes) {
    if (!pattern.empty() && pattern.back() == '*') {
      if (util::startsWith(chain, pattern.substr(0, pattern.size() - 1)))
        return true;
    } else if (chain == pattern || util::startsWith(chain, pattern + ".")) {
      return true;
    }
  }
  return false;
}

bool Validator::CheckAttributes(const Snippet& snippet,
                                std::string* message) const {
  if (!snippet.parsed) return SyntaxFailure(snippet.parse_error, message);
  for (const std::string& chain : snippet.source.DottedNames()) {
    if (IsForbiddenAttribute(chain)) {
      *message = "Forbidden attribute access: " + chain;
      return false;
    }
  }
  for (const PythonSource::Call& call : snippet.source.Calls()) {
    if (call.callee != "open" && call.callee != "io.open") continue;
    if (call.has_string_argument && IsOutsideWorkspace(call.first_string)) {
      *message =
          "Forbidden file access outside workspace: " + call.first_string;
      return false;
    }
  }
  return true;
}

bool Validator::CheckPatterns(const Snippet& snippet,
                              std::string* message) const {
  static const std::regex dunder("__\\w+__");
  const std::string& code = snippet.python_code;
  for (auto it = std::sregex_iterator(code.begin(), code.end(), dunder);
       it != std::sregex_iterator(); ++it) {
    size_t pos = it->position();
    if (pos > 0 && (code[pos - 1] == '!' || code[pos - 1] == '%')) continue;
    *message = "Forbidden pattern found: " + it->str();
    return false;
  }
  return true;
}

std::vector<Dependency> Validator::ValidateDependencies(
    const std::vector<std::string>& requirements) const {
  std::vector<Dependency> approved;
  std::vector<std::string> failures;
  std::set<std::string> seen;
  for (const std::string& requirement : requirements) {
    Dependency dep;
    std::string error;
    if (!ParseRequirement(util::trim(requirement), &dep, &error)) {
      failures.push_back(error);
    } else if (policy_.blocked_packages.count(dep.name)) {
      failures.push_back("Package is blocked: " + dep.name);
    } else if (!policy_.permissive_packages &&
               !policy_.allowed_packages.count(dep.name)) {
      failures.push_back("Package not allowed: " + dep.name);
    } else if (seen.insert(dep.name).second) {
      approved.push_back(dep);
    }
  }
  if (!failures.empty()) {
    KJ_LOG(WARNING, "Rejected dependencies", util::join(failures, "; "));
    throw core::validation_error(util::join(failures, "; "));
  }
  return approved;
}

}  // namespace security
