#include "security/python_scanner.hpp"

#include <cctype>
#include <cstring>
#include <set>
#include <utility>

namespace security {

namespace {

bool IsIdentifierStart(char c) {
  return isalpha(static_cast<unsigned char>(c)) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool IsIdentifierChar(char c) {
  return IsIdentifierStart(c) || isdigit(static_cast<unsigned char>(c));
}

bool IsStringPrefix(std::string word) {
  static const std::set<std::string> prefixes = {"r",  "u",  "b",  "f",
                                                 "br", "rb", "fr", "rf"};
  for (char& c : word) c = tolower(static_cast<unsigned char>(c));
  return prefixes.count(word) > 0;
}

char Unescape(char c) {
  switch (c) {
    case 'n':
      return '\n';
    case 't':
      return '\t';
    case 'r':
      return '\r';
    case '0':
      return '\0';
    default:
      return c;
  }
}

}  // namespace

bool PythonSource::Parse(const std::string& code, std::string* error) {
  tokens_.clear();
  std::vector<std::pair<char, int>> brackets;
  int line = 1;
  size_t i = 0;
  const size_t n = code.size();

  auto fail = [error](const std::string& msg, int at_line) {
    *error = msg + " (line " + std::to_string(at_line) + ")";
    return false;
  };
  auto push = [this, &brackets](Token::Kind kind, std::string text,
                                int at_line) {
    tokens_.push_back(
        Token{kind, std::move(text), at_line,
              static_cast<int>(brackets.size())});
  };
  auto end_statement = [this, &brackets, &push](int at_line) {
    if (brackets.empty() && !tokens_.empty() &&
        tokens_.back().kind != Token::NEWLINE) {
      push(Token::NEWLINE, "", at_line);
    }
  };

  while (i < n) {
    char c = code[i];
    if (c == '\n') {
      end_statement(line);
      line++;
      i++;
      continue;
    }
    if (c == '\\') {
      size_t j = i + 1;
      if (j < n && code[j] == '\r') j++;
      if (j < n && code[j] == '\n') {
        line++;
        i = j + 1;
        continue;
      }
      return fail("unexpected character after line continuation character",
                  line);
    }
    if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
      i++;
      continue;
    }
    if (c == '#') {
      while (i < n && code[i] != '\n') i++;
      continue;
    }

    std::string prefix;
    if (IsIdentifierStart(c)) {
      size_t j = i;
      while (j < n && IsIdentifierChar(code[j])) j++;
      std::string word = code.substr(i, j - i);
      if (j < n && (code[j] == '\'' || code[j] == '"') &&
          IsStringPrefix(word)) {
        prefix = word;
        i = j;
        c = code[i];
      } else {
        push(Token::NAME, word, line);
        i = j;
        continue;
      }
    }

    if (c == '\'' || c == '"') {
      bool raw = prefix.find_first_of("rR") != std::string::npos;
      bool triple = i + 2 < n && code[i + 1] == c && code[i + 2] == c;
      int start_line = line;
      size_t j = i + (triple ? 3 : 1);
      std::string value;
      while (true) {
        if (j >= n) {
          return fail(triple ? "unterminated triple-quoted string literal"
                             : "unterminated string literal",
                      start_line);
        }
        char d = code[j];
        if (d == '\\' && j + 1 < n) {
          char e = code[j + 1];
          if (e == '\n') line++;
          if (raw) {
            value += d;
            value += e;
          } else if (e != '\n') {
            value += Unescape(e);
          }
          j += 2;
          continue;
        }
        if (d == '\n') {
          if (!triple) return fail("unterminated string literal", start_line);
          line++;
        }
        if (d == c) {
          if (!triple) {
            j++;
            break;
          }
          if (j + 2 < n && code[j + 1] == c && code[j + 2] == c) {
            j += 3;
            break;
          }
        }
        value += d;
        j++;
      }
      push(Token::STRING, value, start_line);
      i = j;
      continue;
    }

    if (isdigit(static_cast<unsigned char>(c)) ||
        (c == '.' && i + 1 < n &&
         isdigit(static_cast<unsigned char>(code[i + 1])))) {
      size_t j = i;
      while (j < n && (IsIdentifierChar(code[j]) || code[j] == '.')) j++;
      push(Token::NUMBER, code.substr(i, j - i), line);
      i = j;
      continue;
    }

    if (strchr("([{", c) != nullptr) {
      push(Token::OP, std::string(1, c), line);
      brackets.emplace_back(c, line);
      i++;
      continue;
    }
    if (strchr(")]}", c) != nullptr) {
      char open = c == ')' ? '(' : c == ']' ? '[' : '{';
      if (brackets.empty() || brackets.back().first != open) {
        return fail(std::string("unmatched '") + c + "'", line);
      }
      brackets.pop_back();
      push(Token::OP, std::string(1, c), line);
      i++;
      continue;
    }
    if (c == ';') {
      end_statement(line);
      i++;
      continue;
    }
    if (strchr("+-*/%@&|^~<>=!.,:", c) != nullptr) {
      push(Token::OP, std::string(1, c), line);
      i++;
      continue;
    }
    return fail(std::string("invalid character '") + c + "'", line);
  }
  if (!brackets.empty()) {
    return fail(std::string("'") + brackets.back().first + "' was never closed",
                brackets.back().second);
  }
  return true;
}

bool PythonSource::IsName(size_t i, const char* text) const {
  return i < tokens_.size() && tokens_[i].kind == Token::NAME &&
         tokens_[i].text == text;
}

bool PythonSource::IsOp(size_t i, const char* text) const {
  return i < tokens_.size() && tokens_[i].kind == Token::OP &&
         tokens_[i].text == text;
}

size_t PythonSource::ReadDottedName(size_t i, std::string* name) const {
  name->clear();
  if (i >= tokens_.size() || tokens_[i].kind != Token::NAME) return i;
  *name = tokens_[i++].text;
  while (IsOp(i, ".") && i + 1 < tokens_.size() &&
         tokens_[i + 1].kind == Token::NAME) {
    *name += "." + tokens_[i + 1].text;
    i += 2;
  }
  return i;
}

std::vector<std::string> PythonSource::Imports() const {
  std::vector<std::string> modules;
  std::set<size_t> from_imports;
  for (size_t i = 0; i < tokens_.size(); i++) {
    if (IsName(i, "from")) {
      size_t j = i + 1;
      bool relative = false;
      while (IsOp(j, ".")) {
        relative = true;
        j++;
      }
      std::string name;
      if (!IsName(j, "import")) j = ReadDottedName(j, &name);
      if (IsName(j, "import")) {
        from_imports.insert(j);
        if (!relative && !name.empty()) modules.push_back(name);
      }
    } else if (IsName(i, "import") && from_imports.count(i) == 0) {
      size_t j = i + 1;
      while (true) {
        std::string name;
        j = ReadDottedName(j, &name);
        if (name.empty()) break;
        modules.push_back(name);
        if (IsName(j, "as")) j += 2;
        if (!IsOp(j, ",")) break;
        j++;
      }
    }
  }
  return modules;
}

std::vector<std::string> PythonSource::DottedNames() const {
  std::vector<std::string> names;
  for (size_t i = 0; i < tokens_.size(); i++) {
    if (tokens_[i].kind != Token::NAME) continue;
    if (i > 0 && IsOp(i - 1, ".")) continue;
    std::string name;
    size_t j = ReadDottedName(i, &name);
    if (name.find('.') != std::string::npos) names.push_back(name);
    i = j - 1;
  }
  return names;
}

std::vector<PythonSource::Call> PythonSource::Calls() const {
  std::vector<Call> calls;
  for (size_t i = 0; i < tokens_.size(); i++) {
    if (tokens_[i].kind != Token::NAME) continue;
    if (i > 0 && IsOp(i - 1, ".")) continue;
    if (i > 0 && (IsName(i - 1, "def") || IsName(i - 1, "class"))) continue;
    std::string callee;
    size_t j = ReadDottedName(i, &callee);
    if (IsOp(j, "(")) {
      Call call{callee, false, "", tokens_[i].line};
      if (j + 1 < tokens_.size() && tokens_[j + 1].kind == Token::STRING) {
        call.has_string_argument = true;
        call.first_string = tokens_[j + 1].text;
      }
      calls.push_back(call);
    }
  }
  return calls;
}

}  // namespace security
