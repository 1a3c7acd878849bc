#pragma once

#include <string>
#include <string_view>

#include <rocksdb/status.h>

namespace pagekey {

/**
 * Map a raw page identifier to its canonical form.
 *
 * The canonical form is NFKC-normalized, free of invisible/format, private-use,
 * surrogate and control code points, snake_cased and lowercased, and consists
 * only of Unicode letters, decimal digits, combining marks, '_' and '-'.
 * Letters and digits of any script survive. UUID-shaped identifiers are only
 * lowercased so their hyphen structure is kept. A single leading underscore, a
 * single trailing underscore and a trailing double underscore ("dunderscore")
 * present in the raw input are preserved.
 *
 * Every result is checked before it is returned: it contains no disallowed
 * code point, normalizing it again yields the same string, and it survives a
 * URL path-segment escape/unescape round trip.
 *
 * @param raw Identifier as typed or stored historically (UTF-8)
 * @param out Canonical identifier on success
 * @return OK on success;
 *         InvalidArgument if nothing survives sanitization (reject the input);
 *         Corruption ("internal error: ...") if a post-condition check fails.
 */
rocksdb::Status NormalizeIdentifier(std::string_view raw, std::string* out);

/** True if NormalizeIdentifier(identifier) succeeds and returns identifier unchanged. */
bool IsCanonicalIdentifier(std::string_view identifier);

namespace internal {

/** Percent-encode for use as a single URL path segment. */
std::string PathEscape(std::string_view s);

/** Inverse of PathEscape. InvalidArgument on a malformed escape. */
rocksdb::Status PathUnescape(std::string_view s, std::string* out);

/**
 * True if the UTF-8 string holds a code point that may not appear in a
 * canonical identifier (adversarial, or anything besides letters, digits,
 * marks, '_' and '-').
 */
bool ContainsDisallowedCodePoint(std::string_view utf8);

}  // namespace internal
}  // namespace pagekey
