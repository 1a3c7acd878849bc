#pragma once

#include <string_view>

#include <json/value.h>
#include <rocksdb/status.h>

namespace pagekey {

/**
 * A "---" delimited document split into its parts. Both views point into the
 * content passed to SplitYamlFrontmatter. `frontmatter` excludes both
 * delimiter lines.
 */
struct YamlParts {
  std::string_view frontmatter;
  std::string_view body;
};

/**
 * Split YAML frontmatter from the document body. The opening "---" must be
 * followed by a newline and the block must be closed by a line holding only
 * "---". Returns InvalidArgument otherwise.
 */
rocksdb::Status SplitYamlFrontmatter(std::string_view content, YamlParts* out);

/**
 * Parse the YAML subset used by page frontmatter into a JSON value tree.
 *
 * Supported: block mappings and sequences, flow sequences and mappings,
 * plain, single- and double-quoted scalars, literal (`|`) and folded (`>`)
 * block scalars with chomping indicators. Plain scalars resolve to null,
 * booleans, integers and floats the way YAML 1.1 does; everything else is a
 * string.
 *
 * Anchors, aliases, tags, tab indentation, duplicate keys and inconsistent
 * indentation are rejected with InvalidArgument ("yaml: line N: ...").
 */
rocksdb::Status ParseYaml(std::string_view text, Json::Value* out);

}  // namespace pagekey
