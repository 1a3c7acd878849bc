#include <pagekey/frontmatter.hpp>

#include <pagekey/internal.hpp>
#include <pagekey/yaml.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <utility>

#include <json/json.h>

namespace pagekey {

namespace {

constexpr std::string_view kTomlDelimiter = "+++";
constexpr std::string_view kTomlClosing = "\n+++\n";
constexpr std::string_view kTomlClosingAtEnd = "\n+++";
constexpr std::string_view kIdentifierField = "identifier";

inline bool IsBareKeyChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '_' || c == '-';
}

inline bool IsBareKey(std::string_view key) {
  if (key.empty()) return false;
  for (char c : key) {
    if (!IsBareKeyChar(c)) return false;
  }
  return true;
}

// Index just past the closing delimiter of a triple-quoted string opened at
// `pos`, or npos if it is unterminated.
size_t SkipMultilineString(std::string_view s, size_t pos) {
  const std::string_view delim = s.substr(pos, 3);
  const char quote = delim[0];
  size_t i = pos + 3;
  while (i < s.size()) {
    if (quote == '"' && s[i] == '\\') {
      i += 2;
      continue;
    }
    if (s.compare(i, 3, delim) == 0) {
      i += 3;
      // Up to two quotes may directly precede the closing delimiter
      for (int extra = 0; extra < 2 && i < s.size() && s[i] == quote; ++extra) ++i;
      return i;
    }
    ++i;
  }
  return std::string_view::npos;
}

// Index just past a single-line string opened at `pos` (stops at newline).
size_t SkipString(std::string_view s, size_t pos) {
  const char quote = s[pos];
  size_t i = pos + 1;
  while (i < s.size() && s[i] != quote && s[i] != '\n') {
    if (quote == '"' && s[i] == '\\') ++i;
    ++i;
  }
  if (i < s.size() && s[i] == quote) ++i;
  return i;
}

inline bool IsTripleQuote(std::string_view s, size_t pos) {
  return pos + 3 <= s.size() && (s.compare(pos, 3, "\"\"\"") == 0 || s.compare(pos, 3, "'''") == 0);
}

// Position of the '=' separating key and value, or npos.
size_t FindKeySeparator(std::string_view line) {
  size_t i = 0;
  while (i < line.size()) {
    const char c = line[i];
    if (c == '"' || c == '\'') {
      i = SkipString(line, i);
      continue;
    }
    if (c == '=') return i;
    if (c == '#') return std::string_view::npos;
    ++i;
  }
  return std::string_view::npos;
}

std::string_view HeaderName(std::string_view trimmed, bool array_of_tables) {
  const size_t open = array_of_tables ? 2 : 1;
  const std::string_view close = array_of_tables ? "]]" : "]";
  size_t end = trimmed.find(close, open);
  if (end == std::string_view::npos) end = trimmed.size();
  return internal::TrimView(trimmed.substr(open, end - open));
}

// ---------------------------------------------------------------------------
// String escapes
// ---------------------------------------------------------------------------

rocksdb::Status UnescapeBasic(std::string_view s, bool multiline, std::string* out) {
  out->clear();
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c != '\\') {
      out->push_back(c);
      continue;
    }
    if (++i >= s.size()) {
      return rocksdb::Status::InvalidArgument("dangling escape in TOML string");
    }
    const char e = s[i];
    uint32_t cp = 0;
    switch (e) {
      case 'b': out->push_back('\b'); break;
      case 't': out->push_back('\t'); break;
      case 'n': out->push_back('\n'); break;
      case 'f': out->push_back('\f'); break;
      case 'r': out->push_back('\r'); break;
      case 'e': out->push_back('\x1b'); break;
      case '"': out->push_back('"'); break;
      case '\\': out->push_back('\\'); break;
      case 'u':
      case 'U': {
        const size_t digits = e == 'u' ? 4 : 8;
        if (!internal::ParseHex(s, i + 1, digits, &cp) || !internal::AppendUtf8(cp, out)) {
          return rocksdb::Status::InvalidArgument("invalid unicode escape in TOML string");
        }
        i += digits;
        break;
      }
      default: {
        // Line-ending backslash trims the newline and following whitespace
        size_t j = i;
        while (j < s.size() && (s[j] == ' ' || s[j] == '\t')) ++j;
        if (multiline && (j >= s.size() || s[j] == '\n' || s[j] == '\r')) {
          while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\n' || s[j] == '\r')) ++j;
          i = j - 1;
          break;
        }
        return rocksdb::Status::InvalidArgument("invalid escape in TOML string",
                                                std::string(1, e));
      }
    }
  }
  return rocksdb::Status::OK();
}

std::string_view TrimLeadingNewline(std::string_view s) {
  if (internal::StartsWith(s, "\r\n")) return s.substr(2);
  if (internal::StartsWith(s, "\n")) return s.substr(1);
  return s;
}

// ---------------------------------------------------------------------------
// TOML rendering
// ---------------------------------------------------------------------------

std::string RenderKey(const std::string& key) {
  return IsBareKey(key) ? key : QuoteTomlString(key);
}

std::string JoinPath(const std::string& path, const std::string& key) {
  return path.empty() ? RenderKey(key) : path + "." + RenderKey(key);
}

std::string RenderFloat(double d) {
  if (std::isnan(d)) return "nan";
  if (std::isinf(d)) return d > 0 ? "inf" : "-inf";

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.15g", d);
  if (std::strtod(buf, nullptr) != d) {
    std::snprintf(buf, sizeof(buf), "%.17g", d);
  }
  std::string out(buf);
  if (out.find_first_of(".e") == std::string::npos) out += ".0";
  return out;
}

bool IsArrayOfTables(const Json::Value& v) {
  if (!v.isArray() || v.empty()) return false;
  for (const auto& item : v) {
    if (!item.isObject()) return false;
  }
  return true;
}

rocksdb::Status RenderInline(const Json::Value& v, std::string* out) {
  switch (v.type()) {
    case Json::nullValue:
      return rocksdb::Status::InvalidArgument("TOML cannot represent null values in arrays");
    case Json::intValue:
      *out += std::to_string(v.asInt64());
      return rocksdb::Status::OK();
    case Json::uintValue:
      *out += std::to_string(v.asUInt64());
      return rocksdb::Status::OK();
    case Json::realValue:
      *out += RenderFloat(v.asDouble());
      return rocksdb::Status::OK();
    case Json::stringValue:
      *out += QuoteTomlString(v.asString());
      return rocksdb::Status::OK();
    case Json::booleanValue:
      *out += v.asBool() ? "true" : "false";
      return rocksdb::Status::OK();
    case Json::arrayValue: {
      *out += "[";
      bool first = true;
      for (const auto& item : v) {
        if (!first) *out += ", ";
        first = false;
        rocksdb::Status s = RenderInline(item, out);
        if (!s.ok()) return s;
      }
      *out += "]";
      return rocksdb::Status::OK();
    }
    case Json::objectValue: {
      *out += "{";
      bool first = true;
      for (const auto& name : v.getMemberNames()) {
        const Json::Value& member = v[name];
        if (member.isNull()) continue;
        *out += first ? " " : ", ";
        first = false;
        *out += RenderKey(name) + " = ";
        rocksdb::Status s = RenderInline(member, out);
        if (!s.ok()) return s;
      }
      *out += first ? "}" : " }";
      return rocksdb::Status::OK();
    }
  }
  return rocksdb::Status::InvalidArgument("unsupported value type");
}

rocksdb::Status RenderTable(const Json::Value& table, const std::string& path,
                            const std::string& header, std::string* out) {
  if (!header.empty()) {
    if (!out->empty()) *out += "\n";
    *out += header + "\n";
  }

  const auto names = table.getMemberNames();

  for (const auto& name : names) {
    const Json::Value& v = table[name];
    if (v.isNull() || v.isObject() || IsArrayOfTables(v)) continue;
    *out += RenderKey(name) + " = ";
    rocksdb::Status s = RenderInline(v, out);
    if (!s.ok()) return s;
    *out += "\n";
  }

  for (const auto& name : names) {
    const Json::Value& v = table[name];
    if (!v.isObject()) continue;
    const std::string child = JoinPath(path, name);
    rocksdb::Status s = RenderTable(v, child, "[" + child + "]", out);
    if (!s.ok()) return s;
  }

  for (const auto& name : names) {
    const Json::Value& v = table[name];
    if (!IsArrayOfTables(v)) continue;
    const std::string child = JoinPath(path, name);
    for (const auto& item : v) {
      rocksdb::Status s = RenderTable(item, child, "[[" + child + "]]", out);
      if (!s.ok()) return s;
    }
  }
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// YAML field helpers
// ---------------------------------------------------------------------------

// Byte range of the inline value of a root-level `key:` line, or false.
bool FindYamlRootValue(std::string_view frontmatter, std::string_view key, size_t* begin,
                       size_t* end) {
  size_t pos = 0;
  while (pos <= frontmatter.size()) {
    size_t eol = frontmatter.find('\n', pos);
    if (eol == std::string_view::npos) eol = frontmatter.size();
    std::string_view line = frontmatter.substr(pos, eol - pos);

    if (internal::StartsWith(line, key) && line.size() > key.size() &&
        line[key.size()] == ':') {
      size_t v = key.size() + 1;
      while (v < line.size() && (line[v] == ' ' || line[v] == '\t')) ++v;

      if (v < line.size() && (line[v] == '|' || line[v] == '>' || line[v] == '&' ||
                              line[v] == '*' || line[v] == '!' || line[v] == '[' ||
                              line[v] == '{')) {
        return false;
      }

      size_t e = v;
      if (v < line.size() && (line[v] == '"' || line[v] == '\'')) {
        e = SkipString(line, v);
      } else {
        // Plain scalar ends at a comment
        while (e < line.size() && !(line[e] == '#' && e > v && line[e - 1] == ' ')) ++e;
      }
      while (e > v && (line[e - 1] == ' ' || line[e - 1] == '\t' || line[e - 1] == '\r')) --e;
      if (e == v) return false;

      *begin = pos + v;
      *end = pos + e;
      return true;
    }
    if (eol == frontmatter.size()) break;
    pos = eol + 1;
  }
  return false;
}

}  // namespace

const char* FrontmatterFormatName(FrontmatterFormat format) {
  switch (format) {
    case FrontmatterFormat::kYAML: return "yaml";
    case FrontmatterFormat::kTOML: return "toml";
    case FrontmatterFormat::kJSON: return "json";
    case FrontmatterFormat::kUnknown: return "unknown";
  }
  return "unknown";
}

FrontmatterFormat DetectFrontmatterFormat(std::string_view content) {
  if (content.size() < 3) return FrontmatterFormat::kUnknown;
  if (internal::StartsWith(content, "---")) return FrontmatterFormat::kYAML;
  if (internal::StartsWith(content, "+++")) return FrontmatterFormat::kTOML;
  if (content[0] == '{') return FrontmatterFormat::kJSON;
  return FrontmatterFormat::kUnknown;
}

bool SplitTomlFrontmatter(std::string_view content, TomlParts* out) {
  if (!out || !internal::StartsWith(content, kTomlDelimiter)) return false;

  std::string_view rest = content.substr(kTomlDelimiter.size());
  size_t closing = rest.find(kTomlClosing);
  if (closing != std::string_view::npos) {
    out->frontmatter = rest.substr(0, closing + 1);
    out->body = rest.substr(closing + kTomlClosing.size());
    return true;
  }

  // Closing delimiter on the last line without a newline
  if (rest.size() >= kTomlClosingAtEnd.size() &&
      rest.compare(rest.size() - kTomlClosingAtEnd.size(), kTomlClosingAtEnd.size(),
                   kTomlClosingAtEnd) == 0) {
    closing = rest.size() - kTomlClosingAtEnd.size();
    out->frontmatter = rest.substr(0, closing + 1);
    out->body = std::string_view();
    return true;
  }
  return false;
}

std::vector<TomlStatement> ScanTomlStatements(std::string_view fm) {
  std::vector<TomlStatement> statements;

  size_t pos = 0;
  while (pos < fm.size()) {
    size_t eol = fm.find('\n', pos);
    if (eol == std::string_view::npos) eol = fm.size();
    const std::string_view line = fm.substr(pos, eol - pos);
    const std::string_view trimmed = internal::TrimView(line);

    TomlStatement st;
    st.begin = pos;
    size_t end = eol;

    if (trimmed.empty()) {
      st.kind = TomlStatement::Kind::kBlank;
    } else if (trimmed[0] == '#') {
      st.kind = TomlStatement::Kind::kComment;
    } else if (internal::StartsWith(trimmed, "[[")) {
      st.kind = TomlStatement::Kind::kArrayOfTables;
      st.name = std::string(HeaderName(trimmed, true));
    } else if (trimmed[0] == '[') {
      st.kind = TomlStatement::Kind::kTable;
      st.name = std::string(HeaderName(trimmed, false));
    } else {
      const size_t eq = FindKeySeparator(line);
      if (eq == std::string_view::npos) {
        st.kind = TomlStatement::Kind::kOther;
      } else {
        st.kind = TomlStatement::Kind::kKeyValue;
        st.name = std::string(internal::TrimView(line.substr(0, eq)));

        size_t i = pos + eq + 1;
        while (i < fm.size() && (fm[i] == ' ' || fm[i] == '\t')) ++i;
        const size_t value_begin = i;
        size_t last = value_begin;
        int depth = 0;

        while (i < fm.size()) {
          const char c = fm[i];
          if (c == '\n') {
            if (depth <= 0) break;
            ++i;
            continue;
          }
          if (c == '#') {
            while (i < fm.size() && fm[i] != '\n') ++i;
            continue;
          }
          if (IsTripleQuote(fm, i)) {
            const size_t close = SkipMultilineString(fm, i);
            i = close == std::string_view::npos ? fm.size() : close;
            last = i;
            continue;
          }
          if (c == '"' || c == '\'') {
            i = SkipString(fm, i);
            last = i;
            continue;
          }
          if (c == '[' || c == '{') {
            ++depth;
          } else if ((c == ']' || c == '}') && depth > 0) {
            --depth;
          }
          if (c != ' ' && c != '\t' && c != '\r') last = i + 1;
          ++i;
        }

        end = i;
        st.value_begin = value_begin;
        st.value_end = last;
        st.value = std::string(fm.substr(value_begin, last - value_begin));
      }
    }

    st.text = std::string(internal::TrimView(fm.substr(pos, end - pos)));
    statements.push_back(std::move(st));
    pos = end + 1;
  }
  return statements;
}

bool IsBareDottedKey(std::string_view key) {
  size_t segments = 0;
  size_t start = 0;
  while (true) {
    const size_t dot = key.find('.', start);
    const std::string_view segment =
        key.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    if (!IsBareKey(segment)) return false;
    ++segments;
    if (dot == std::string_view::npos) break;
    start = dot + 1;
  }
  return segments >= 2;
}

rocksdb::Status ParseTomlString(std::string_view value, std::string* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  value = internal::TrimView(value);

  if (value.size() >= 6 && (internal::StartsWith(value, "\"\"\"") ||
                            internal::StartsWith(value, "'''"))) {
    const std::string_view delim = value.substr(0, 3);
    if (value.compare(value.size() - 3, 3, delim) != 0) {
      return rocksdb::Status::InvalidArgument("unterminated multi-line TOML string");
    }
    std::string_view inner = TrimLeadingNewline(value.substr(3, value.size() - 6));
    if (delim[0] == '\'') {
      *out = std::string(inner);
      return rocksdb::Status::OK();
    }
    std::string decoded;
    rocksdb::Status s = UnescapeBasic(inner, true, &decoded);
    if (!s.ok()) return s;
    *out = std::move(decoded);
    return rocksdb::Status::OK();
  }

  if (value.size() >= 2 && (value[0] == '"' || value[0] == '\'')) {
    const char quote = value[0];
    if (SkipString(value, 0) != value.size() || value.back() != quote) {
      return rocksdb::Status::InvalidArgument("not a single TOML string literal");
    }
    std::string_view inner = value.substr(1, value.size() - 2);
    if (quote == '\'') {
      *out = std::string(inner);
      return rocksdb::Status::OK();
    }
    std::string decoded;
    rocksdb::Status s = UnescapeBasic(inner, false, &decoded);
    if (!s.ok()) return s;
    *out = std::move(decoded);
    return rocksdb::Status::OK();
  }

  return rocksdb::Status::InvalidArgument("not a TOML string");
}

std::string QuoteTomlString(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\t': out += "\\t"; break;
      case '\n': out += "\\n"; break;
      case '\f': out += "\\f"; break;
      case '\r': out += "\\r"; break;
      default:
        if (c < 0x20 || c == 0x7f) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04X", c);
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  out.push_back('"');
  return out;
}

rocksdb::Status RenderToml(const Json::Value& root, std::string* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (!root.isObject() && !root.isNull()) {
    return rocksdb::Status::InvalidArgument("TOML document root must be a table");
  }

  std::string result;
  if (root.isObject()) {
    rocksdb::Status s = RenderTable(root, "", "", &result);
    if (!s.ok()) return s;
  }
  *out = std::move(result);
  return rocksdb::Status::OK();
}

rocksdb::Status FindTomlStringField(std::string_view frontmatter, std::string_view table,
                                    std::string_view key, TomlStringField* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  const std::string dotted = table.empty() ? std::string() : std::string(table) + "." + std::string(key);

  std::string current;
  bool in_array_table = false;
  for (const auto& st : ScanTomlStatements(frontmatter)) {
    switch (st.kind) {
      case TomlStatement::Kind::kTable:
        current = st.name;
        in_array_table = false;
        break;
      case TomlStatement::Kind::kArrayOfTables:
        current = st.name;
        in_array_table = true;
        break;
      case TomlStatement::Kind::kKeyValue: {
        if (in_array_table) break;
        const bool direct = current == table && st.name == key;
        const bool via_dotted = !dotted.empty() && current.empty() && st.name == dotted;
        if (!direct && !via_dotted) break;

        TomlStringField field;
        rocksdb::Status s = ParseTomlString(st.value, &field.value);
        if (!s.ok()) {
          return rocksdb::Status::InvalidArgument("field is not a string", st.name);
        }
        field.value_begin = st.value_begin;
        field.value_end = st.value_end;
        *out = std::move(field);
        return rocksdb::Status::OK();
      }
      default:
        break;
    }
  }
  return rocksdb::Status::NotFound("field not found", std::string(key));
}

rocksdb::Status ExtractEmbeddedIdentifier(std::string_view content, std::string* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  switch (DetectFrontmatterFormat(content)) {
    case FrontmatterFormat::kTOML: {
      TomlParts parts;
      if (!SplitTomlFrontmatter(content, &parts)) break;
      TomlStringField field;
      rocksdb::Status s = FindTomlStringField(parts.frontmatter, "", kIdentifierField, &field);
      if (!s.ok()) break;
      *out = std::move(field.value);
      return rocksdb::Status::OK();
    }
    case FrontmatterFormat::kYAML: {
      YamlParts parts;
      if (!SplitYamlFrontmatter(content, &parts).ok()) break;
      Json::Value root;
      if (!ParseYaml(parts.frontmatter, &root).ok()) break;
      if (!root.isObject() || !root[std::string(kIdentifierField)].isString()) break;
      *out = root[std::string(kIdentifierField)].asString();
      return rocksdb::Status::OK();
    }
    case FrontmatterFormat::kJSON: {
      Json::CharReaderBuilder builder;
      std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
      Json::Value root;
      std::string errors;
      if (!reader->parse(content.data(), content.data() + content.size(), &root, &errors)) break;
      if (!root.isObject() || !root[std::string(kIdentifierField)].isString()) break;
      *out = root[std::string(kIdentifierField)].asString();
      return rocksdb::Status::OK();
    }
    case FrontmatterFormat::kUnknown:
      break;
  }
  return rocksdb::Status::NotFound("document declares no identifier");
}

rocksdb::Status RewriteEmbeddedIdentifier(std::string_view content, std::string_view identifier,
                                          std::string* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  switch (DetectFrontmatterFormat(content)) {
    case FrontmatterFormat::kTOML: {
      TomlParts parts;
      if (!SplitTomlFrontmatter(content, &parts)) break;
      TomlStringField field;
      if (!FindTomlStringField(parts.frontmatter, "", kIdentifierField, &field).ok()) break;

      const size_t base = static_cast<size_t>(parts.frontmatter.data() - content.data());
      std::string result(content.substr(0, base + field.value_begin));
      result += QuoteTomlString(identifier);
      result += content.substr(base + field.value_end);
      *out = std::move(result);
      return rocksdb::Status::OK();
    }
    case FrontmatterFormat::kYAML: {
      YamlParts parts;
      if (!SplitYamlFrontmatter(content, &parts).ok()) break;
      size_t begin = 0;
      size_t end = 0;
      if (!FindYamlRootValue(parts.frontmatter, kIdentifierField, &begin, &end)) break;

      // Quoting rules of YAML double-quoted scalars cover TOML basic escapes
      const size_t base = static_cast<size_t>(parts.frontmatter.data() - content.data());
      std::string result(content.substr(0, base + begin));
      result += QuoteTomlString(identifier);
      result += content.substr(base + end);
      *out = std::move(result);
      return rocksdb::Status::OK();
    }
    case FrontmatterFormat::kJSON: {
      Json::CharReaderBuilder reader_builder;
      std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
      Json::Value root;
      std::string errors;
      if (!reader->parse(content.data(), content.data() + content.size(), &root, &errors)) break;
      if (!root.isObject() || !root.isMember(std::string(kIdentifierField))) break;

      root[std::string(kIdentifierField)] = std::string(identifier);
      Json::StreamWriterBuilder writer;
      writer["indentation"] = "  ";
      *out = Json::writeString(writer, root);
      return rocksdb::Status::OK();
    }
    case FrontmatterFormat::kUnknown:
      break;
  }

  *out = std::string(content);
  return rocksdb::Status::OK();
}

}  // namespace pagekey
