#include <pagekey/migration.hpp>

#include <pagekey/identifier.hpp>
#include <pagekey/internal.hpp>
#include <pagekey/yaml.hpp>

#include <map>
#include <set>
#include <utility>

#include <json/value.h>

namespace pagekey {

namespace {

using StatementKind = TomlStatement::Kind;

constexpr std::string_view kTomlDelimiter = "+++";

std::string JoinKey(const std::string& table, const std::string& key) {
  return table.empty() ? key : table + "." + key;
}

bool HasArrayOfTables(const std::vector<TomlStatement>& statements) {
  for (const auto& st : statements) {
    if (st.kind == StatementKind::kArrayOfTables) return true;
  }
  return false;
}

// Full paths of every key that is assigned a value.
std::set<std::string> AssignedPaths(const std::vector<TomlStatement>& statements) {
  std::set<std::string> paths;
  std::string current;
  for (const auto& st : statements) {
    if (st.kind == StatementKind::kTable) {
      current = st.name;
    } else if (st.kind == StatementKind::kKeyValue) {
      paths.insert(JoinKey(current, st.name));
    }
  }
  return paths;
}

struct DottedKey {
  std::string prefix;
  std::string leaf;
};

// Split the full path of a dotted assignment; false if it should stay put.
bool MovableDottedKey(const std::string& table, const TomlStatement& st,
                      const std::set<std::string>& assigned, DottedKey* out) {
  if (st.kind != StatementKind::kKeyValue || !IsBareDottedKey(st.name)) return false;

  const std::string full = JoinKey(table, st.name);
  const size_t dot = full.rfind('.');
  DottedKey key{full.substr(0, dot), full.substr(dot + 1)};

  // `a = 1` next to `a.b = 2` is not ours to fix
  if (assigned.count(key.prefix) > 0) return false;

  *out = std::move(key);
  return true;
}

struct TableSection {
  std::vector<std::string> moved;
  std::vector<std::string> moved_keys;
  std::vector<std::string> existing;
  std::set<std::string> existing_keys;
};

std::string MergeDottedKeys(const std::vector<TomlStatement>& statements) {
  const std::set<std::string> assigned = AssignedPaths(statements);

  std::vector<std::string> ungrouped;
  std::map<std::string, TableSection> tables;
  std::string current;

  for (const auto& st : statements) {
    switch (st.kind) {
      case StatementKind::kBlank:
        break;
      case StatementKind::kTable:
        current = st.name;
        tables[current];
        break;
      case StatementKind::kKeyValue: {
        DottedKey key;
        if (MovableDottedKey(current, st, assigned, &key)) {
          // Keep everything after '=' including a trailing comment
          const size_t eq = st.text.find('=', st.name.size());
          const std::string_view tail = internal::TrimView(std::string_view(st.text).substr(eq + 1));
          TableSection& section = tables[key.prefix];
          section.moved.push_back(key.leaf + " = " + std::string(tail));
          section.moved_keys.push_back(key.leaf);
          break;
        }
        if (current.empty()) {
          ungrouped.push_back(st.text);
        } else {
          tables[current].existing.push_back(st.text);
          tables[current].existing_keys.insert(st.name);
        }
        break;
      }
      default:
        if (current.empty()) {
          ungrouped.push_back(st.text);
        } else {
          tables[current].existing.push_back(st.text);
        }
        break;
    }
  }

  std::vector<std::string> lines = std::move(ungrouped);
  for (const auto& [name, section] : tables) {
    lines.push_back("[" + name + "]");
    for (size_t i = 0; i < section.moved.size(); ++i) {
      if (section.existing_keys.count(section.moved_keys[i]) > 0) continue;
      lines.push_back(section.moved[i]);
    }
    lines.insert(lines.end(), section.existing.begin(), section.existing.end());
  }

  std::string result;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) result += "\n";
    result += lines[i];
  }
  return result;
}

// Offsets of table headers that directly follow a non-blank statement.
std::vector<size_t> HeadersMissingSpacing(const std::vector<TomlStatement>& statements) {
  std::vector<size_t> offsets;
  const TomlStatement* prev = nullptr;
  bool seen_content = false;
  for (const auto& st : statements) {
    const bool header =
        st.kind == StatementKind::kTable || st.kind == StatementKind::kArrayOfTables;
    if (header && seen_content && prev && prev->kind != StatementKind::kBlank) {
      offsets.push_back(st.begin);
    }
    if (st.kind != StatementKind::kBlank) seen_content = true;
    prev = &st;
  }
  return offsets;
}

// Shared by the field-level migrations: the field's location when it holds a
// string whose canonical form differs.
bool FindMungeableField(std::string_view content, std::string_view table, std::string_view key,
                        TomlParts* parts, TomlStringField* field, std::string* canonical) {
  if (!SplitTomlFrontmatter(content, parts)) return false;
  if (!FindTomlStringField(parts->frontmatter, table, key, field).ok()) return false;
  if (!NormalizeIdentifier(field->value, canonical).ok()) return false;
  return *canonical != field->value;
}

rocksdb::Status MungeField(std::string_view content, std::string_view table,
                           std::string_view key, std::string* out) {
  TomlParts parts;
  TomlStringField field;
  std::string canonical;
  if (!SplitTomlFrontmatter(content, &parts)) {
    *out = std::string(content);
    return rocksdb::Status::OK();
  }
  rocksdb::Status s = FindTomlStringField(parts.frontmatter, table, key, &field);
  if (s.IsNotFound()) {
    *out = std::string(content);
    return rocksdb::Status::OK();
  }
  if (!s.ok()) return s;

  s = NormalizeIdentifier(field.value, &canonical);
  if (!s.ok()) return s;
  if (canonical == field.value) {
    *out = std::string(content);
    return rocksdb::Status::OK();
  }

  const size_t base = static_cast<size_t>(parts.frontmatter.data() - content.data());
  std::string result(content.substr(0, base + field.value_begin));
  result += QuoteTomlString(canonical);
  result += content.substr(base + field.value_end);
  *out = std::move(result);
  return rocksdb::Status::OK();
}

}  // namespace

// ---------------------------------------------------------------------------
// YamlToTomlMigration
// ---------------------------------------------------------------------------

std::vector<FrontmatterFormat> YamlToTomlMigration::SupportedFormats() const {
  return {FrontmatterFormat::kYAML};
}

bool YamlToTomlMigration::AppliesTo(std::string_view content) const {
  return DetectFrontmatterFormat(content) == FrontmatterFormat::kYAML;
}

rocksdb::Status YamlToTomlMigration::Apply(std::string_view content, std::string* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  YamlParts parts;
  rocksdb::Status s = SplitYamlFrontmatter(content, &parts);
  if (!s.ok()) return s;

  if (internal::TrimView(parts.frontmatter).empty()) {
    *out = std::string(content);
    return rocksdb::Status::OK();
  }

  Json::Value data;
  s = ParseYaml(parts.frontmatter, &data);
  if (!s.ok()) return s;
  if (data.isNull()) data = Json::Value(Json::objectValue);
  if (!data.isObject()) {
    return rocksdb::Status::InvalidArgument("YAML frontmatter is not a mapping");
  }

  std::string toml;
  s = RenderToml(data, &toml);
  if (!s.ok()) return s;

  std::string result;
  result.reserve(toml.size() + parts.body.size() + 8);
  result += "+++\n";
  result += toml;
  result += "+++\n";
  result += parts.body;
  *out = std::move(result);
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// TomlDottedKeyMigration
// ---------------------------------------------------------------------------

std::vector<FrontmatterFormat> TomlDottedKeyMigration::SupportedFormats() const {
  return {FrontmatterFormat::kTOML};
}

bool TomlDottedKeyMigration::AppliesTo(std::string_view content) const {
  TomlParts parts;
  if (!SplitTomlFrontmatter(content, &parts)) return false;

  const auto statements = ScanTomlStatements(parts.frontmatter);
  if (HasArrayOfTables(statements)) return false;

  const std::set<std::string> assigned = AssignedPaths(statements);
  std::string current;
  for (const auto& st : statements) {
    if (st.kind == StatementKind::kTable) current = st.name;
    DottedKey key;
    if (MovableDottedKey(current, st, assigned, &key)) return true;
  }
  return false;
}

rocksdb::Status TomlDottedKeyMigration::Apply(std::string_view content, std::string* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  TomlParts parts;
  if (!SplitTomlFrontmatter(content, &parts)) {
    *out = std::string(content);
    return rocksdb::Status::OK();
  }

  const auto statements = ScanTomlStatements(parts.frontmatter);
  if (HasArrayOfTables(statements)) {
    *out = std::string(content);
    return rocksdb::Status::OK();
  }

  std::string result;
  result += kTomlDelimiter;
  result += "\n";
  result += MergeDottedKeys(statements);
  result += "\n";
  result += kTomlDelimiter;
  result += "\n";
  result += parts.body;
  *out = std::move(result);
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// TomlTableSpacingMigration
// ---------------------------------------------------------------------------

std::vector<FrontmatterFormat> TomlTableSpacingMigration::SupportedFormats() const {
  return {FrontmatterFormat::kTOML};
}

bool TomlTableSpacingMigration::AppliesTo(std::string_view content) const {
  TomlParts parts;
  if (!SplitTomlFrontmatter(content, &parts)) return false;
  return !HeadersMissingSpacing(ScanTomlStatements(parts.frontmatter)).empty();
}

rocksdb::Status TomlTableSpacingMigration::Apply(std::string_view content,
                                                 std::string* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  TomlParts parts;
  if (!SplitTomlFrontmatter(content, &parts)) {
    *out = std::string(content);
    return rocksdb::Status::OK();
  }

  const std::string_view fm = parts.frontmatter;
  const std::vector<size_t> offsets = HeadersMissingSpacing(ScanTomlStatements(fm));

  std::string spaced;
  spaced.reserve(fm.size() + offsets.size());
  size_t copied = 0;
  for (size_t offset : offsets) {
    spaced += fm.substr(copied, offset - copied);
    spaced += "\n";
    copied = offset;
  }
  spaced += fm.substr(copied);

  // The frontmatter keeps its leading and trailing newlines
  std::string result;
  result += kTomlDelimiter;
  result += spaced;
  result += kTomlDelimiter;
  result += "\n";
  result += parts.body;
  *out = std::move(result);
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// IdentifierFieldMigration
// ---------------------------------------------------------------------------

std::vector<FrontmatterFormat> IdentifierFieldMigration::SupportedFormats() const {
  return {FrontmatterFormat::kTOML};
}

bool IdentifierFieldMigration::AppliesTo(std::string_view content) const {
  TomlParts parts;
  TomlStringField field;
  std::string canonical;
  return FindMungeableField(content, "", "identifier", &parts, &field, &canonical);
}

rocksdb::Status IdentifierFieldMigration::Apply(std::string_view content,
                                                std::string* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  return MungeField(content, "", "identifier", out);
}

// ---------------------------------------------------------------------------
// InventoryContainerMigration
// ---------------------------------------------------------------------------

std::vector<FrontmatterFormat> InventoryContainerMigration::SupportedFormats() const {
  return {FrontmatterFormat::kTOML};
}

bool InventoryContainerMigration::AppliesTo(std::string_view content) const {
  TomlParts parts;
  TomlStringField field;
  std::string canonical;
  return FindMungeableField(content, "inventory", "container", &parts, &field, &canonical);
}

rocksdb::Status InventoryContainerMigration::Apply(std::string_view content,
                                                   std::string* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  return MungeField(content, "inventory", "container", out);
}

}  // namespace pagekey
