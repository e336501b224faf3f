#ifndef SECURITY_PYTHON_SCANNER_HPP
#define SECURITY_PYTHON_SCANNER_HPP

#include <string>
#include <vector>

namespace security {

// A lexical view of a Python source, sufficient to find the constructs the
// validator cares about without executing or fully parsing the code.
class PythonSource {
 public:
  struct Token {
    enum Kind { NAME, NUMBER, STRING, OP, NEWLINE };
    Kind kind;
    std::string text;  // For STRING, the literal value without quotes.
    int line;
    int depth;  // Bracket nesting depth at the start of the token.
  };

  // A call whose callee is a plain or dotted name, e.g. "eval" or
  // "builtins.eval". first_string is the value of the first argument when it
  // is a string literal.
  struct Call {
    std::string callee;
    bool has_string_argument;
    std::string first_string;
    int line;
  };

  // Tokenizes code. Returns false and sets error on unterminated strings,
  // unbalanced brackets or stray characters.
  bool Parse(const std::string& code, std::string* error);

  const std::vector<Token>& Tokens() const { return tokens_; }

  // Modules named by import statements, as written ("os.path").
  std::vector<std::string> Imports() const;

  // Maximal dotted name chains, e.g. "os.path.join" for os.path.join(x).
  std::vector<std::string> DottedNames() const;

  std::vector<Call> Calls() const;

 private:
  // Reads a dotted name starting at token i. Returns the index past it.
  size_t ReadDottedName(size_t i, std::string* name) const;
  bool IsName(size_t i, const char* text) const;
  bool IsOp(size_t i, const char* text) const;

  std::vector<Token> tokens_;
};

}  // namespace security

#endif
