#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <json/value.h>
#include <rocksdb/status.h>

namespace pagekey {

/** Structured header format of a stored document, sniffed from its first bytes. */
enum class FrontmatterFormat {
  kYAML,     // "---"
  kTOML,     // "+++"
  kJSON,     // "{"
  kUnknown,  // anything else, or shorter than three bytes
};

const char* FrontmatterFormatName(FrontmatterFormat format);

FrontmatterFormat DetectFrontmatterFormat(std::string_view content);

// ---------------------------------------------------------------------------
// TOML frontmatter
// ---------------------------------------------------------------------------

/**
 * A "+++" delimited document split into its parts. Both views point into the
 * content passed to SplitTomlFrontmatter.
 *
 * `frontmatter` is everything between the opening "+++" and the closing
 * "\n+++" line: it starts with the newline that ends the opening delimiter and
 * keeps the newline before the closing one.
 */
struct TomlParts {
  std::string_view frontmatter;
  std::string_view body;
};

/** False if the content does not open with "+++" or has no closing "+++" line. */
bool SplitTomlFrontmatter(std::string_view content, TomlParts* out);

/** One logical TOML statement, possibly spanning several physical lines. */
struct TomlStatement {
  enum class Kind {
    kBlank,
    kComment,
    kTable,         // [name]
    kArrayOfTables, // [[name]]
    kKeyValue,      // key = value
    kOther,
  };

  Kind kind = Kind::kOther;

  // Statement text without the trailing newline and without outer whitespace.
  std::string text;

  // kTable / kArrayOfTables: table name. kKeyValue: the key as written.
  std::string name;

  // Byte offset of the statement's first line within the scanned frontmatter.
  size_t begin = 0;

  // kKeyValue: the value without any trailing comment.
  std::string value;

  // kKeyValue: byte range of `value` within the scanned frontmatter.
  size_t value_begin = 0;
  size_t value_end = 0;
};

/**
 * Split TOML text into statements. Arrays and triple-quoted strings that span
 * several lines are kept together as one statement.
 */
std::vector<TomlStatement> ScanTomlStatements(std::string_view frontmatter);

/** True for a bare dotted key such as `a.b.c` (two or more bare segments). */
bool IsBareDottedKey(std::string_view key);

/**
 * Parse a TOML string literal (basic, literal, or either multi-line form).
 * Returns InvalidArgument if `value` is not exactly one string literal.
 */
rocksdb::Status ParseTomlString(std::string_view value, std::string* out);

/** Render `s` as a TOML basic string, including the quotes. */
std::string QuoteTomlString(std::string_view s);

/**
 * Render a JSON object tree as a TOML document: root scalars and arrays first,
 * then `[tables]` and `[[arrays of tables]]`, keys in sorted order, one blank
 * line before every header. Null members are omitted.
 * Returns InvalidArgument if `root` is not an object or an array holds nulls.
 */
rocksdb::Status RenderToml(const Json::Value& root, std::string* out);

/** Location and decoded value of a string field inside TOML frontmatter. */
struct TomlStringField {
  std::string value;
  size_t value_begin = 0;  // byte offsets of the literal within the frontmatter
  size_t value_end = 0;
};

/**
 * Find the string field `key` of `table` ("" for the root table).
 *
 * A field of a named table is found under its `[table]` header or as a
 * root-level dotted assignment `table.key = ...`.
 *
 * @return OK and the field;
 *         NotFound if the field is absent;
 *         InvalidArgument if it is present but not a string.
 */
rocksdb::Status FindTomlStringField(std::string_view frontmatter, std::string_view table,
                                    std::string_view key, TomlStringField* out);

// ---------------------------------------------------------------------------
// Embedded page identifier
// ---------------------------------------------------------------------------

/**
 * Read the `identifier` field a document declares about itself: a root-level
 * string in TOML or YAML frontmatter, or a string member of a JSON document.
 * Returns NotFound if the document declares none.
 */
rocksdb::Status ExtractEmbeddedIdentifier(std::string_view content, std::string* out);

/**
 * Set the embedded `identifier` field to `identifier`.
 *
 * TOML and YAML frontmatter have only the field's value bytes replaced; a JSON
 * document is re-serialized. A document without the field (or without
 * recognized frontmatter) is returned unchanged.
 */
rocksdb::Status RewriteEmbeddedIdentifier(std::string_view content, std::string_view identifier,
                                          std::string* out);

}  // namespace pagekey
