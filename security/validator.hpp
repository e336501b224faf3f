#ifndef SECURITY_VALIDATOR_HPP
#define SECURITY_VALIDATOR_HPP

#include <map>
#include <string>
#include <vector>

#include "security/policy.hpp"

namespace security {

// A package requirement that passed validation.
struct Dependency {
  std::string name;       // Normalized name.
  std::string specifier;  // Version constraints, e.g. ">=1.2,<2", or empty.

  // The argument to hand to the package installer.
  std::string Requirement() const { return name + specifier; }
};

struct ValidationResult {
  bool valid;
  std::string message;
};

// Statically checks submitted code and requested packages against a Policy.
// Rules can be toggled only before the validator is shared between threads;
// the checks themselves are const and thread-safe.
class Validator {
 public:
  static const constexpr char* kJupyterCommands = "jupyter_commands";
  static const constexpr char* kDangerousBuiltins = "dangerous_builtins";
  static const constexpr char* kDangerousImports = "dangerous_imports";
  static const constexpr char* kDangerousAttributes = "dangerous_attributes";
  static const constexpr char* kDangerousPatterns = "dangerous_patterns";

  static const constexpr size_t kMaxCodeLength = 10000;

  explicit Validator(Policy policy);
  virtual ~Validator() = default;

  // Toggles a rule by name; "all" toggles every rule. Unknown names are
  // ignored.
  void EnableRule(const std::string& name);
  void DisableRule(const std::string& name);
  bool IsRuleEnabled(const std::string& name) const;

  // Runs every enabled rule. Failures are joined with "; ".
  ValidationResult CheckCode(const std::string& code) const;

  // Like CheckCode, but throws core::validation_error on failure.
  virtual void ValidateCode(const std::string& code) const;

  // Parses and checks each requirement ("name", "name==1.0", ...). Returns the
  // approved set, without duplicates, or throws core::validation_error listing
  // every rejected entry.
  std::vector<Dependency> ValidateDependencies(
      const std::vector<std::string>& requirements) const;

  const Policy& GetPolicy() const { return policy_; }

 private:
  struct Snippet;
  using Rule = bool (Validator::*)(const Snippet& snippet,
                                   std::string* message) const;

  bool CheckJupyterCommands(const Snippet& snippet, std::string* message) const;
  bool CheckBuiltins(const Snippet& snippet, std::string* message) const;
  bool CheckImports(const Snippet& snippet, std::string* message) const;
  bool CheckAttributes(const Snippet& snippet, std::string* message) const;
  bool CheckPatterns(const Snippet& snippet, std::string* message) const;

  bool IsForbiddenAttribute(const std::string& chain) const;

  Policy policy_;
  std::vector<std::pair<std::string, Rule>> rules_;
  std::map<std::string, bool> enabled_;
};

}  // namespace security

#endif
