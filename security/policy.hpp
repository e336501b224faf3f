#ifndef SECURITY_POLICY_HPP
#define SECURITY_POLICY_HPP

#include <set>
#include <string>
#include <vector>

namespace security {

// Allow and block rules shared by every validation. A Policy is built once at
// startup and only read afterwards.
struct Policy {
  // Installable packages, by normalized name.
  std::set<std::string> allowed_packages;
  std::set<std::string> blocked_packages;
  // Accept packages that are neither allowed nor blocked.
  bool permissive_packages = false;

  // Top-level modules that code may not import.
  std::set<std::string> forbidden_modules;
  std::set<std::string> forbidden_builtins;
  // Dotted attribute chains; a trailing * matches any suffix.
  std::vector<std::string> forbidden_attributes;
  // First words accepted after ! in shell escape lines.
  std::set<std::string> allowed_shell_commands;
  // Permit raw socket use from code.
  bool allow_network = false;

  std::set<std::string> disabled_rules;

  // The built-in rules.
  static Policy Default();

  // Overrides the built-in rules with the keys present in a JSON document.
  // Throws std::invalid_argument on malformed documents.
  static Policy FromJson(const std::string& text);

  // Reads FromJson from a file. An empty path gives Default().
  static Policy Load(const std::string& path);
};

// Canonical form of a package name: lower case, with runs of '_' and '.'
// replaced by '-'.
std::string NormalizePackageName(const std::string& name);

}  // namespace security

#endif
