#include "security/validator.hpp"
#include "core/errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

using security::Policy;
using security::Validator;

class ValidatorTest : public ::testing::Test {
 protected:
  Validator validator_{Policy::Default()};
};

// NOLINTNEXTLINE
TEST_F(ValidatorTest, SafeCode) {
  auto result = validator_.CheckCode(
      "\ndef add(a, b):\n    return a + b\nprint(add(2, 2))\n    ");
  EXPECT_TRUE(result.valid) << result.message;
  EXPECT_EQ(result.message, "Code validation passed");
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, DangerousImports) {
  for (const char* code :
       {"import os", "import subprocess", "from multiprocessing import Pool",
        "import numpy, pickle", "import socket"}) {
    auto result = validator_.CheckCode(code);
    EXPECT_FALSE(result.valid) << code;
    EXPECT_THAT(result.message, HasSubstr("Forbidden import")) << code;
  }
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, SocketAllowedWithNetwork) {
  Policy policy = Policy::Default();
  policy.allow_network = true;
  Validator validator(policy);
  EXPECT_TRUE(validator.CheckCode("import socket").valid);
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, DangerousBuiltins) {
  auto result = validator_.CheckCode("eval('2 + 2')");
  EXPECT_FALSE(result.valid);
  EXPECT_THAT(result.message, HasSubstr("Forbidden function call: eval"));
  EXPECT_FALSE(validator_.CheckCode("builtins.exec('x = 1')").valid);
  EXPECT_TRUE(validator_.CheckCode("print('hello')").valid);
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, DunderImportRejected) {
  auto result = validator_.CheckCode("__import__('os').system('rm -rf /')");
  EXPECT_FALSE(result.valid);
  EXPECT_THAT(result.message, HasSubstr("Forbidden function call: __import__"));
  EXPECT_THAT(result.message, HasSubstr("Forbidden pattern found: __import__"));
  EXPECT_THROW(  // NOLINT
      validator_.ValidateCode("__import__('os').system('rm -rf /')"),
      core::validation_error);
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, DangerousAttributes) {
  Validator validator(Policy::Default());
  validator.DisableRule(Validator::kDangerousImports);
  auto result = validator.CheckCode("import os\nos.system('ls')");
  EXPECT_FALSE(result.valid);
  EXPECT_THAT(result.message,
              HasSubstr("Forbidden attribute access: os.system"));
  EXPECT_FALSE(validator.CheckCode("os.execv('/bin/sh', [])").valid);
  EXPECT_TRUE(
      validator.CheckCode("import os\np = os.path.join('a', 'b')").valid);
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, FileAccessOutsideWorkspace) {
  auto result = validator_.CheckCode("print(open('/etc/passwd').read())");
  EXPECT_FALSE(result.valid);
  EXPECT_THAT(result.message, HasSubstr("outside workspace: /etc/passwd"));
  EXPECT_FALSE(validator_.CheckCode("open('../secret.txt')").valid);
  EXPECT_TRUE(validator_.CheckCode("open('outputs/data.csv', 'w')").valid);
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, ShellCommands) {
  EXPECT_TRUE(validator_.CheckCode("!pip install numpy").valid);
  EXPECT_TRUE(validator_.CheckCode("!pip list").valid);
  auto result = validator_.CheckCode("!rm -rf /");
  EXPECT_FALSE(result.valid);
  EXPECT_THAT(result.message, HasSubstr("Shell command not allowed: rm"));
  EXPECT_FALSE(validator_.CheckCode("!sudo apt-get update").valid);
  EXPECT_FALSE(validator_.CheckCode("!pip list; rm -rf /").valid);
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, MagicCommands) {
  EXPECT_TRUE(validator_.CheckCode("%matplotlib inline").valid);
  EXPECT_TRUE(validator_.CheckCode("%%time\nprint('hello')").valid);
  EXPECT_TRUE(validator_.CheckCode("%run script.py").valid);
  EXPECT_FALSE(validator_.CheckCode("%%bash\nrm -rf /").valid);
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, MixedCode) {
  auto result = validator_.CheckCode(
      "\n!pip install pandas\n%matplotlib inline\n\nimport pandas as pd\n"
      "df = pd.DataFrame({'a': [1, 2, 3]})\nprint(df)\n    ");
  EXPECT_TRUE(result.valid) << result.message;

  result = validator_.CheckCode(
      "\n!pip install pandas\nimport os  # This should still be caught\n");
  EXPECT_FALSE(result.valid);
  EXPECT_THAT(result.message, HasSubstr("Forbidden import"));

  result = validator_.CheckCode(
      "\n    !pip install pandas  # Allowed\n    !rm -rf /  # Not allowed\n");
  EXPECT_FALSE(result.valid);
  EXPECT_THAT(result.message, HasSubstr("Shell command not allowed"));
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, SyntaxError) {
  auto result = validator_.CheckCode("print('unterminated)");
  EXPECT_FALSE(result.valid);
  EXPECT_THAT(result.message, HasSubstr("Invalid Python syntax"));
  EXPECT_EQ(result.message.find("Invalid Python syntax"),
            result.message.rfind("Invalid Python syntax"));
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, FailuresJoined) {
  auto result = validator_.CheckCode("!rm -rf /\nimport sys");
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.message,
            "Shell command not allowed: rm; Forbidden import: sys");
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, EnableDisableRules) {
  Validator validator(Policy::Default());
  validator.DisableRule(Validator::kDangerousImports);
  EXPECT_TRUE(validator.CheckCode("import os").valid);
  validator.EnableRule(Validator::kDangerousImports);
  auto result = validator.CheckCode("import os");
  EXPECT_FALSE(result.valid);
  EXPECT_THAT(result.message, HasSubstr("Forbidden import"));

  validator.DisableRule("all");
  EXPECT_TRUE(validator.CheckCode("eval('1')\n!rm -rf /").valid);
  validator.DisableRule("no_such_rule");
  EXPECT_FALSE(validator.IsRuleEnabled("no_such_rule"));
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, RulesDisabledByPolicy) {
  Policy policy = Policy::Default();
  policy.disabled_rules = {"dangerous_patterns"};
  Validator validator(policy);
  EXPECT_FALSE(validator.IsRuleEnabled(Validator::kDangerousPatterns));
  EXPECT_TRUE(validator.CheckCode("x = __name__").valid);
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, CodeTooLong) {
  std::string code(Validator::kMaxCodeLength + 1, '#');
  auto result = validator_.CheckCode(code);
  EXPECT_FALSE(result.valid);
  EXPECT_THAT(result.message, HasSubstr("too long"));
}

/*
 * Dependencies
 */

// NOLINTNEXTLINE
TEST_F(ValidatorTest, DependenciesAllowed) {
  auto deps = validator_.ValidateDependencies(
      {"numpy", "Pandas>=1.5,<3", "scikit_learn==1.3.0", "numpy"});
  ASSERT_EQ(deps.size(), 3);
  EXPECT_EQ(deps[0].Requirement(), "numpy");
  EXPECT_EQ(deps[1].name, "pandas");
  EXPECT_EQ(deps[1].specifier, ">=1.5,<3");
  EXPECT_EQ(deps[2].Requirement(), "scikit-learn==1.3.0");
  EXPECT_THAT(validator_.ValidateDependencies({}), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, DependenciesUnknownRejected) {
  try {
    validator_.ValidateDependencies({"numpy", "leftpad", "evil_pkg"});
    FAIL() << "expected validation_error";
  } catch (const core::validation_error& e) {
    EXPECT_STREQ(e.what(),
                 "Package not allowed: leftpad; Package not allowed: evil-pkg");
  }
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, DependenciesBlocked) {
  Policy policy = Policy::Default();
  policy.permissive_packages = true;
  policy.blocked_packages = {"forbidden-pkg"};
  Validator validator(policy);
  EXPECT_EQ(validator.ValidateDependencies({"leftpad"}).size(), 1u);
  EXPECT_THROW(validator.ValidateDependencies({"Forbidden_Pkg"}),  // NOLINT
               core::validation_error);
  EXPECT_FALSE(validator.CheckCode("import forbidden_pkg").valid);
}

// NOLINTNEXTLINE
TEST_F(ValidatorTest, DependenciesShellMetacharacters) {
  for (const char* req : {"numpy; rm -rf /", "numpy && curl x", "$(id)",
                          "numpy`id`", "numpy ==1.0", "numpy[extra]", "",
                          "numpy==", "numpy=>1", "-e git+x"}) {
    EXPECT_THROW(validator_.ValidateDependencies({req}),  // NOLINT
                 core::validation_error)
        << req;
  }
}

}  // namespace
