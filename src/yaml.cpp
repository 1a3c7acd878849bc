#include <pagekey/yaml.hpp>

#include <pagekey/internal.hpp>

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace pagekey {

namespace {

constexpr std::string_view kYamlDelimiter = "---";

// ---------------------------------------------------------------------------
// Plain scalar resolution (YAML 1.1 core types)
// ---------------------------------------------------------------------------

bool IsOneOf(std::string_view s, std::initializer_list<std::string_view> options) {
  for (auto o : options) {
    if (s == o) return true;
  }
  return false;
}

bool ResolveInteger(std::string_view s, Json::Value* out) {
  std::string digits;
  digits.reserve(s.size());
  for (char c : s) {
    if (c != '_') digits.push_back(c);
  }
  if (digits.empty()) return false;

  size_t i = 0;
  if (digits[0] == '+' || digits[0] == '-') ++i;
  if (i >= digits.size()) return false;

  int base = 10;
  if (digits.compare(i, 2, "0x") == 0) {
    base = 16;
  } else if (digits.compare(i, 2, "0b") == 0) {
    base = 2;
  }
  const size_t first_digit = base == 10 ? i : i + 2;
  if (first_digit >= digits.size()) return false;

  for (size_t j = first_digit; j < digits.size(); ++j) {
    const char c = digits[j];
    const bool ok = base == 16 ? std::isxdigit(static_cast<unsigned char>(c)) != 0
                  : base == 2  ? (c == '0' || c == '1')
                               : (c >= '0' && c <= '9');
    if (!ok) return false;
  }

  std::string parse = digits.substr(first_digit);
  if (digits[0] == '-') parse.insert(parse.begin(), '-');

  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(parse.c_str(), &end, base);
  if (errno == ERANGE || end != parse.c_str() + parse.size()) return false;
  *out = Json::Value(static_cast<Json::Int64>(v));
  return true;
}

bool ResolveFloat(std::string_view s, Json::Value* out) {
  if (IsOneOf(s, {".inf", ".Inf", ".INF", "+.inf", "+.Inf", "+.INF"})) {
    *out = Json::Value(std::numeric_limits<double>::infinity());
    return true;
  }
  if (IsOneOf(s, {"-.inf", "-.Inf", "-.INF"})) {
    *out = Json::Value(-std::numeric_limits<double>::infinity());
    return true;
  }
  if (IsOneOf(s, {".nan", ".NaN", ".NAN"})) {
    *out = Json::Value(std::numeric_limits<double>::quiet_NaN());
    return true;
  }

  // [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
  size_t i = 0;
  if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
  size_t int_digits = 0;
  while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i, ++int_digits;
  size_t frac_digits = 0;
  bool has_dot = false;
  if (i < s.size() && s[i] == '.') {
    has_dot = true;
    ++i;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i, ++frac_digits;
  }
  if (int_digits == 0 && frac_digits == 0) return false;
  bool has_exp = false;
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    has_exp = true;
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    size_t exp_digits = 0;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i, ++exp_digits;
    if (exp_digits == 0) return false;
  }
  if (i != s.size() || (!has_dot && !has_exp)) return false;

  const std::string text(s);
  *out = Json::Value(std::strtod(text.c_str(), nullptr));
  return true;
}

Json::Value ResolvePlain(std::string_view s) {
  if (IsOneOf(s, {"", "~", "null", "Null", "NULL"})) return Json::Value();
  if (IsOneOf(s, {"y", "Y", "yes", "Yes", "YES", "true", "True", "TRUE", "on", "On", "ON"})) {
    return Json::Value(true);
  }
  if (IsOneOf(s, {"n", "N", "no", "No", "NO", "false", "False", "FALSE", "off", "Off", "OFF"})) {
    return Json::Value(false);
  }
  Json::Value number;
  if (ResolveInteger(s, &number) || ResolveFloat(s, &number)) return number;
  return Json::Value(std::string(s));
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

class YamlParser {
 public:
  explicit YamlParser(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
      size_t eol = text.find('\n', pos);
      if (eol == std::string_view::npos) eol = text.size();
      std::string line(text.substr(pos, eol - pos));
      if (!line.empty() && line.back() == '\r') line.pop_back();
      lines_.push_back(std::move(line));
      if (eol == text.size()) break;
      pos = eol + 1;
    }
  }

  rocksdb::Status Parse(Json::Value* out) {
    rocksdb::Status s = ParseBlock(0, out);
    if (!s.ok()) return s;
    s = SkipBlank();
    if (!s.ok()) return s;
    if (pos_ < lines_.size()) return Error("unexpected content");
    return rocksdb::Status::OK();
  }

 private:
  rocksdb::Status Error(const std::string& msg) const {
    return rocksdb::Status::InvalidArgument(
        "yaml: line " + std::to_string(pos_ + 1) + ": " + msg);
  }

  static bool IsBlankOrComment(const std::string& line) {
    const size_t first = line.find_first_not_of(" \t");
    return first == std::string::npos || line[first] == '#';
  }

  static bool IsDocumentMarker(const std::string& line) {
    return line == "---" || line == "...";
  }

  rocksdb::Status SkipBlank() {
    while (pos_ < lines_.size() &&
           (IsBlankOrComment(lines_[pos_]) || IsDocumentMarker(lines_[pos_]))) {
      ++pos_;
    }
    return rocksdb::Status::OK();
  }

  rocksdb::Status Indent(const std::string& line, int* out) const {
    size_t i = 0;
    while (i < line.size() && line[i] == ' ') ++i;
    if (i < line.size() && line[i] == '\t') return Error("tab characters must not be used in indentation");
    *out = static_cast<int>(i);
    return rocksdb::Status::OK();
  }

  static bool IsSequenceEntry(std::string_view content) {
    return content == "-" || internal::StartsWith(content, "- ");
  }

  // Strip a trailing comment outside of quotes and brackets.
  static std::string_view StripComment(std::string_view s) {
    char quote = 0;
    for (size_t i = 0; i < s.size(); ++i) {
      const char c = s[i];
      if (quote) {
        if (quote == '"' && c == '\\') {
          ++i;
        } else if (c == quote) {
          quote = 0;
        }
        continue;
      }
      if (c == '"' || c == '\'') {
        // Quotes only open a scalar at the start of a token
        if (i == 0 || s[i - 1] == ' ' || s[i - 1] == '[' || s[i - 1] == '{' ||
            s[i - 1] == ',' || s[i - 1] == ':') {
          quote = c;
        }
        continue;
      }
      if (c == '#' && (i == 0 || s[i - 1] == ' ' || s[i - 1] == '\t')) {
        return internal::TrimView(s.substr(0, i));
      }
    }
    return internal::TrimView(s);
  }

  // Split "key: rest". False if the content is not a mapping entry.
  rocksdb::Status SplitKey(std::string_view content, bool* is_entry, std::string* key,
                           std::string_view* rest) const {
    *is_entry = false;
    if (content.empty() || content[0] == '[' || content[0] == '{' || content[0] == '#' ||
        IsSequenceEntry(content)) {
      return rocksdb::Status::OK();
    }

    size_t colon = std::string_view::npos;
    if (content[0] == '"' || content[0] == '\'') {
      size_t consumed = 0;
      std::string k;
      rocksdb::Status s = ParseQuoted(content, &k, &consumed);
      if (!s.ok()) return s;
      size_t i = consumed;
      while (i < content.size() && content[i] == ' ') ++i;
      if (i >= content.size() || content[i] != ':') return rocksdb::Status::OK();
      if (i + 1 < content.size() && content[i + 1] != ' ') return rocksdb::Status::OK();
      colon = i;
      *key = std::move(k);
    } else {
      for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == ':' && (i + 1 == content.size() || content[i + 1] == ' ')) {
          colon = i;
          break;
        }
        if (content[i] == '#' && i > 0 && content[i - 1] == ' ') break;
      }
      if (colon == std::string_view::npos) return rocksdb::Status::OK();
      *key = std::string(internal::TrimView(content.substr(0, colon)));
      if (key->empty()) return Error("empty mapping key");
      if ((*key)[0] == '&' || (*key)[0] == '*' || (*key)[0] == '!') {
        return Error("anchors, aliases and tags are not supported");
      }
      if (*key == "<<") return Error("merge keys are not supported");
    }

    *rest = content.substr(colon + 1);
    *is_entry = true;
    return rocksdb::Status::OK();
  }

  // Parse a quoted scalar at the start of `s`; `consumed` is its length.
  rocksdb::Status ParseQuoted(std::string_view s, std::string* out, size_t* consumed) const {
    const char quote = s[0];
    std::string result;
    size_t i = 1;
    while (i < s.size()) {
      const char c = s[i];
      if (quote == '\'') {
        if (c == '\'') {
          if (i + 1 < s.size() && s[i + 1] == '\'') {
            result.push_back('\'');
            i += 2;
            continue;
          }
          *out = std::move(result);
          *consumed = i + 1;
          return rocksdb::Status::OK();
        }
        result.push_back(c);
        ++i;
        continue;
      }

      if (c == '"') {
        *out = std::move(result);
        *consumed = i + 1;
        return rocksdb::Status::OK();
      }
      if (c != '\\') {
        result.push_back(c);
        ++i;
        continue;
      }
      if (i + 1 >= s.size()) return Error("unterminated escape");
      const char e = s[i + 1];
      uint32_t cp = 0;
      size_t digits = 0;
      switch (e) {
        case '0': result.push_back('\0'); break;
        case 'a': result.push_back('\a'); break;
        case 'b': result.push_back('\b'); break;
        case 't': case '\t': result.push_back('\t'); break;
        case 'n': result.push_back('\n'); break;
        case 'v': result.push_back('\v'); break;
        case 'f': result.push_back('\f'); break;
        case 'r': result.push_back('\r'); break;
        case 'e': result.push_back('\x1b'); break;
        case ' ': result.push_back(' '); break;
        case '"': result.push_back('"'); break;
        case '/': result.push_back('/'); break;
        case '\\': result.push_back('\\'); break;
        case 'N': internal::AppendUtf8(0x85, &result); break;
        case '_': internal::AppendUtf8(0xA0, &result); break;
        case 'L': internal::AppendUtf8(0x2028, &result); break;
        case 'P': internal::AppendUtf8(0x2029, &result); break;
        case 'x': digits = 2; break;
        case 'u': digits = 4; break;
        case 'U': digits = 8; break;
        default:
          return Error(std::string("invalid escape \\") + e);
      }
      if (digits > 0) {
        if (!internal::ParseHex(s, i + 2, digits, &cp) || !internal::AppendUtf8(cp, &result)) {
          return Error("invalid unicode escape");
        }
        i += digits;
      }
      i += 2;
    }
    return Error("unterminated quoted scalar");
  }

  rocksdb::Status CheckNodeProperty(std::string_view text) const {
    if (text.empty()) return rocksdb::Status::OK();
    if (text[0] == '&') return Error("anchors are not supported");
    if (text[0] == '*') return Error("aliases are not supported");
    if (text[0] == '!') return Error("tags are not supported");
    return rocksdb::Status::OK();
  }

  // ---- flow collections ---------------------------------------------------

  static void SkipSpaces(std::string_view s, size_t* i) {
    while (*i < s.size() && (s[*i] == ' ' || s[*i] == '\t')) ++*i;
  }

  rocksdb::Status ParseFlowScalar(std::string_view s, size_t* i, bool as_key, Json::Value* out) const {
    SkipSpaces(s, i);
    if (*i >= s.size()) return Error("unexpected end of flow collection");

    rocksdb::Status st = CheckNodeProperty(s.substr(*i));
    if (!st.ok()) return st;

    if (s[*i] == '"' || s[*i] == '\'') {
      std::string v;
      size_t consumed = 0;
      st = ParseQuoted(s.substr(*i), &v, &consumed);
      if (!st.ok()) return st;
      *i += consumed;
      *out = Json::Value(v);
      return rocksdb::Status::OK();
    }

    const size_t start = *i;
    while (*i < s.size()) {
      const char c = s[*i];
      if (c == ',' || c == ']' || c == '}') break;
      if (as_key && c == ':' && (*i + 1 >= s.size() || s[*i + 1] == ' ' || s[*i + 1] == ',' ||
                                 s[*i + 1] == '}')) {
        break;
      }
      ++*i;
    }
    const std::string_view text = internal::TrimView(s.substr(start, *i - start));
    *out = as_key ? Json::Value(std::string(text)) : ResolvePlain(text);
    return rocksdb::Status::OK();
  }

  rocksdb::Status ParseFlow(std::string_view s, size_t* i, Json::Value* out) const {
    SkipSpaces(s, i);
    if (*i >= s.size()) return Error("unexpected end of flow collection");

    if (s[*i] == '[') {
      ++*i;
      Json::Value arr(Json::arrayValue);
      while (true) {
        SkipSpaces(s, i);
        if (*i >= s.size()) return Error("unterminated flow sequence");
        if (s[*i] == ']') {
          ++*i;
          break;
        }
        Json::Value item;
        rocksdb::Status st = ParseFlow(s, i, &item);
        if (!st.ok()) return st;
        arr.append(item);
        SkipSpaces(s, i);
        if (*i < s.size() && s[*i] == ',') {
          ++*i;
        } else if (*i < s.size() && s[*i] != ']') {
          return Error("expected ',' or ']' in flow sequence");
        }
      }
      *out = std::move(arr);
      return rocksdb::Status::OK();
    }

    if (s[*i] == '{') {
      ++*i;
      Json::Value obj(Json::objectValue);
      while (true) {
        SkipSpaces(s, i);
        if (*i >= s.size()) return Error("unterminated flow mapping");
        if (s[*i] == '}') {
          ++*i;
          break;
        }
        Json::Value key;
        rocksdb::Status st = ParseFlowScalar(s, i, true, &key);
        if (!st.ok()) return st;
        const std::string name = key.asString();
        SkipSpaces(s, i);
        Json::Value value;
        if (*i < s.size() && s[*i] == ':') {
          ++*i;
          SkipSpaces(s, i);
          if (*i < s.size() && s[*i] != ',' && s[*i] != '}') {
            st = ParseFlow(s, i, &value);
            if (!st.ok()) return st;
          }
        }
        if (obj.isMember(name)) return Error("duplicate key \"" + name + "\"");
        obj[name] = value;
        SkipSpaces(s, i);
        if (*i < s.size() && s[*i] == ',') {
          ++*i;
        } else if (*i < s.size() && s[*i] != '}') {
          return Error("expected ',' or '}' in flow mapping");
        }
      }
      *out = std::move(obj);
      return rocksdb::Status::OK();
    }

    return ParseFlowScalar(s, i, false, out);
  }

  static bool FlowBalanced(std::string_view s) {
    int depth = 0;
    char quote = 0;
    for (size_t i = 0; i < s.size(); ++i) {
      const char c = s[i];
      if (quote) {
        if (quote == '"' && c == '\\') {
          ++i;
        } else if (c == quote) {
          quote = 0;
        }
        continue;
      }
      if (c == '"' || c == '\'') quote = c;
      if (c == '[' || c == '{') ++depth;
      if (c == ']' || c == '}') --depth;
    }
    return depth <= 0;
  }

  // ---- block scalars ------------------------------------------------------

  rocksdb::Status ParseBlockScalar(std::string_view header, int parent_indent, Json::Value* out) {
    const bool literal = header[0] == '|';
    char chomp = 0;
    int explicit_indent = 0;
    for (size_t i = 1; i < header.size(); ++i) {
      const char c = header[i];
      if ((c == '-' || c == '+') && chomp == 0) {
        chomp = c;
      } else if (c >= '1' && c <= '9' && explicit_indent == 0) {
        explicit_indent = c - '0';
      } else {
        return Error("invalid block scalar header");
      }
    }
    ++pos_;

    int content_indent = explicit_indent > 0 ? parent_indent + explicit_indent : -1;
    std::vector<std::string> body;
    while (pos_ < lines_.size()) {
      const std::string& line = lines_[pos_];
      const size_t first = line.find_first_not_of(' ');
      if (first == std::string::npos) {
        body.emplace_back();
        ++pos_;
        continue;
      }
      const int indent = static_cast<int>(first);
      if (content_indent < 0) {
        if (indent <= parent_indent) break;
        content_indent = indent;
      }
      if (indent < content_indent) break;
      body.push_back(line.substr(static_cast<size_t>(content_indent)));
      ++pos_;
    }

    // Trailing blank lines only matter for "keep" chomping
    size_t trailing = 0;
    while (!body.empty() && body.back().empty()) {
      body.pop_back();
      ++trailing;
    }

    std::string text;
    if (literal) {
      for (size_t i = 0; i < body.size(); ++i) {
        if (i > 0) text += "\n";
        text += body[i];
      }
    } else {
      bool started = false;
      bool prev_normal = false;
      size_t empties = 0;
      for (const auto& l : body) {
        if (l.empty()) {
          ++empties;
          continue;
        }
        const bool normal = l[0] != ' ' && l[0] != '\t';
        if (started) {
          if (empties == 0) {
            text += (normal && prev_normal) ? " " : "\n";
          } else {
            text.append(empties, '\n');
            if (!(normal && prev_normal)) text += "\n";
          }
        } else {
          text.append(empties, '\n');
        }
        text += l;
        started = true;
        prev_normal = normal;
        empties = 0;
      }
    }

    if (!body.empty()) {
      if (chomp == '+') {
        text += "\n";
        text.append(trailing, '\n');
      } else if (chomp != '-') {
        text += "\n";
      }
    } else if (chomp == '+') {
      text.append(trailing, '\n');
    }

    *out = Json::Value(text);
    return rocksdb::Status::OK();
  }

  // ---- inline values ------------------------------------------------------

  // Parse the value text following "key:" or "- " on the current line, which
  // has already been consumed. `indent` is the owning node's indentation.
  rocksdb::Status ParseInlineValue(std::string_view raw, int indent, Json::Value* out) {
    std::string_view text = StripComment(raw);
    rocksdb::Status s = CheckNodeProperty(text);
    if (!s.ok()) return s;

    if (text.empty()) {
      *out = Json::Value();
      return rocksdb::Status::OK();
    }

    if (text[0] == '"' || text[0] == '\'') {
      std::string v;
      size_t consumed = 0;
      s = ParseQuoted(text, &v, &consumed);
      if (!s.ok()) return s;
      if (!internal::TrimView(text.substr(consumed)).empty()) {
        return Error("unexpected characters after quoted scalar");
      }
      *out = Json::Value(v);
      return rocksdb::Status::OK();
    }

    if (text[0] == '[' || text[0] == '{') {
      std::string joined(text);
      while (!FlowBalanced(joined) && pos_ < lines_.size()) {
        joined += " ";
        joined += std::string(StripComment(lines_[pos_]));
        ++pos_;
      }
      size_t i = 0;
      s = ParseFlow(joined, &i, out);
      if (!s.ok()) return s;
      if (!internal::TrimView(std::string_view(joined).substr(i)).empty()) {
        return Error("unexpected characters after flow collection");
      }
      return rocksdb::Status::OK();
    }

    // Plain scalars may continue on more-indented lines
    std::string plain(text);
    while (pos_ < lines_.size() && !IsBlankOrComment(lines_[pos_])) {
      int next_indent = 0;
      s = Indent(lines_[pos_], &next_indent);
      if (!s.ok()) return s;
      if (next_indent <= indent) break;
      plain += " ";
      plain += std::string(StripComment(lines_[pos_]));
      ++pos_;
    }
    *out = ResolvePlain(plain);
    return rocksdb::Status::OK();
  }

  // ---- block collections --------------------------------------------------

  // Parse a node whose lines are indented by more than `parent_indent`
  // (or exactly `parent_indent` for a sequence owned by a mapping key).
  rocksdb::Status ParseBlock(int min_indent, Json::Value* out) {
    SkipBlank();
    if (pos_ >= lines_.size()) {
      *out = Json::Value();
      return rocksdb::Status::OK();
    }

    int indent = 0;
    rocksdb::Status s = Indent(lines_[pos_], &indent);
    if (!s.ok()) return s;
    if (indent < min_indent) {
      *out = Json::Value();
      return rocksdb::Status::OK();
    }

    const std::string_view content = std::string_view(lines_[pos_]).substr(indent);
    if (IsSequenceEntry(content)) return ParseSequence(indent, out);

    bool is_entry = false;
    std::string key;
    std::string_view rest;
    s = SplitKey(content, &is_entry, &key, &rest);
    if (!s.ok()) return s;
    if (is_entry) return ParseMapping(indent, out);

    ++pos_;
    return ParseInlineValue(content, indent - 1, out);
  }

  // Value of a mapping entry or sequence item whose inline text is `rest`.
  rocksdb::Status ParseNodeValue(std::string_view rest, int indent, bool allow_same_indent_seq,
                                 Json::Value* out) {
    const std::string_view trimmed = StripComment(rest);
    if (!trimmed.empty() && (trimmed[0] == '|' || trimmed[0] == '>')) {
      return ParseBlockScalar(trimmed, indent, out);
    }
    if (!trimmed.empty()) {
      ++pos_;
      return ParseInlineValue(rest, indent, out);
    }

    ++pos_;
    SkipBlank();
    if (pos_ >= lines_.size()) {
      *out = Json::Value();
      return rocksdb::Status::OK();
    }
    int next = 0;
    rocksdb::Status s = Indent(lines_[pos_], &next);
    if (!s.ok()) return s;
    if (next > indent) return ParseBlock(indent + 1, out);
    if (allow_same_indent_seq && next == indent &&
        IsSequenceEntry(std::string_view(lines_[pos_]).substr(next))) {
      return ParseSequence(indent, out);
    }
    *out = Json::Value();
    return rocksdb::Status::OK();
  }

  rocksdb::Status ParseMapping(int indent, Json::Value* out) {
    Json::Value map(Json::objectValue);
    while (true) {
      SkipBlank();
      if (pos_ >= lines_.size()) break;

      int li = 0;
      rocksdb::Status s = Indent(lines_[pos_], &li);
      if (!s.ok()) return s;
      if (li < indent) break;
      if (li > indent) return Error("bad indentation of a mapping entry");

      const std::string_view content = std::string_view(lines_[pos_]).substr(li);
      if (IsSequenceEntry(content)) break;

      bool is_entry = false;
      std::string key;
      std::string_view rest;
      s = SplitKey(content, &is_entry, &key, &rest);
      if (!s.ok()) return s;
      if (!is_entry) return Error("expected a mapping key");
      if (map.isMember(key)) return Error("duplicate key \"" + key + "\"");

      Json::Value value;
      s = ParseNodeValue(rest, indent, true, &value);
      if (!s.ok()) return s;
      map[key] = value;
    }
    *out = std::move(map);
    return rocksdb::Status::OK();
  }

  rocksdb::Status ParseSequence(int indent, Json::Value* out) {
    Json::Value seq(Json::arrayValue);
    while (true) {
      SkipBlank();
      if (pos_ >= lines_.size()) break;

      int li = 0;
      rocksdb::Status s = Indent(lines_[pos_], &li);
      if (!s.ok()) return s;
      if (li < indent) break;
      if (li > indent) return Error("bad indentation of a sequence entry");

      const std::string_view content = std::string_view(lines_[pos_]).substr(li);
      if (!IsSequenceEntry(content)) break;

      // Item text after "- "
      std::string_view item = content.size() > 1 ? content.substr(2) : std::string_view();
      size_t shift = 0;
      while (shift < item.size() && item[shift] == ' ') ++shift;
      item = item.substr(shift);
      const int item_indent = indent + 2 + static_cast<int>(shift);

      Json::Value value;
      bool nested = IsSequenceEntry(item);
      if (!nested) {
        bool is_entry = false;
        std::string key;
        std::string_view rest;
        s = SplitKey(item, &is_entry, &key, &rest);
        if (!s.ok()) return s;
        nested = is_entry;
      }

      if (nested) {
        // Re-read the item as a block node that starts at its own column
        lines_[pos_] = std::string(static_cast<size_t>(item_indent), ' ') + std::string(item);
        s = ParseBlock(item_indent, &value);
      } else {
        s = ParseNodeValue(item, indent, false, &value);
      }
      if (!s.ok()) return s;
      seq.append(value);
    }
    *out = std::move(seq);
    return rocksdb::Status::OK();
  }

  std::vector<std::string> lines_;
  size_t pos_ = 0;
};

}  // namespace

rocksdb::Status SplitYamlFrontmatter(std::string_view content, YamlParts* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (!internal::StartsWith(content, kYamlDelimiter)) {
    return rocksdb::Status::InvalidArgument("content does not start with YAML delimiter");
  }

  std::string_view rest = content.substr(kYamlDelimiter.size());
  if (internal::StartsWith(rest, "\r\n")) {
    rest.remove_prefix(2);
  } else if (internal::StartsWith(rest, "\n")) {
    rest.remove_prefix(1);
  } else {
    return rocksdb::Status::InvalidArgument("YAML delimiter not followed by newline");
  }

  // The closing delimiter is a line holding only "---"
  size_t line_start = 0;
  while (line_start <= rest.size()) {
    size_t eol = rest.find('\n', line_start);
    const size_t line_end = eol == std::string_view::npos ? rest.size() : eol;
    std::string_view line = rest.substr(line_start, line_end - line_start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    if (line == kYamlDelimiter) {
      out->frontmatter = rest.substr(0, line_start);
      out->body = eol == std::string_view::npos ? std::string_view() : rest.substr(eol + 1);
      return rocksdb::Status::OK();
    }
    if (eol == std::string_view::npos) break;
    line_start = eol + 1;
  }
  return rocksdb::Status::InvalidArgument("closing YAML delimiter not found");
}

rocksdb::Status ParseYaml(std::string_view text, Json::Value* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  YamlParser parser(text);
  Json::Value root;
  rocksdb::Status s = parser.Parse(&root);
  if (!s.ok()) return s;
  *out = std::move(root);
  return rocksdb::Status::OK();
}

}  // namespace pagekey
