#include <pagekey/identifier.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

namespace pagekey {

namespace {

using CodePoints = std::vector<UChar32>;

constexpr UChar32 kUnderscore = '_';
constexpr UChar32 kHyphen = '-';

// Length of a UUID in its 8-4-4-4-12 textual form
constexpr size_t kUuidLength = 36;

// ---------------------------------------------------------------------------
// Code point classes
// ---------------------------------------------------------------------------

// Invisible or spoofable code points that are removed outright: format (Cf),
// private use (Co), surrogates (Cs) and controls (Cc) other than tab/LF/CR.
// Tab, LF and CR are replaced with '_' later instead.
bool IsAdversarial(UChar32 c) {
  switch (u_charType(c)) {
    case U_FORMAT_CHAR:
    case U_PRIVATE_USE_CHAR:
    case U_SURROGATE:
      return true;
    case U_CONTROL_CHAR:
      return c != '\t' && c != '\n' && c != '\r';
    default:
      return false;
  }
}

bool IsMark(UChar32 c) { return (U_GET_GC_MASK(c) & U_GC_M_MASK) != 0; }

// Letters (L*), decimal digits (Nd), marks (M*), '_' and '-'
bool IsAllowed(UChar32 c) {
  return c == kUnderscore || c == kHyphen || u_isalpha(c) || u_isdigit(c) || IsMark(c);
}

inline bool IsAsciiUpper(UChar32 c) { return c >= 'A' && c <= 'Z'; }
inline bool IsAsciiLower(UChar32 c) { return c >= 'a' && c <= 'z'; }
inline UChar32 AsciiLower(UChar32 c) { return IsAsciiUpper(c) ? c + ('a' - 'A') : c; }

inline bool IsHexDigit(UChar32 c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

inline bool IsWordDelimiter(UChar32 c) {
  return c == kHyphen || c == kUnderscore || c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// ---------------------------------------------------------------------------
// UTF-8 <-> code points
// ---------------------------------------------------------------------------

rocksdb::Status DecodeNfkc(std::string_view utf8, CodePoints* out) {
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2* nfkc = icu::Normalizer2::getNFKCInstance(status);
  if (U_FAILURE(status) || nfkc == nullptr) {
    return rocksdb::Status::Corruption("internal error: NFKC normalizer unavailable",
                                       u_errorName(status));
  }

  // Ill-formed UTF-8 decodes to U+FFFD, which is later replaced with '_'
  icu::UnicodeString u = icu::UnicodeString::fromUTF8(
      icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
  icu::UnicodeString normalized = nfkc->normalize(u, status);
  if (U_FAILURE(status)) {
    return rocksdb::Status::Corruption("internal error: NFKC normalization failed",
                                       u_errorName(status));
  }

  out->clear();
  out->reserve(static_cast<size_t>(normalized.length()));
  for (int32_t i = 0; i < normalized.length();) {
    UChar32 c = normalized.char32At(i);
    out->push_back(c);
    i += U16_LENGTH(c);
  }
  return rocksdb::Status::OK();
}

std::string EncodeUtf8(const CodePoints& cps) {
  icu::UnicodeString u;
  for (UChar32 c : cps) u.append(c);
  std::string out;
  u.toUTF8String(out);
  return out;
}

// ---------------------------------------------------------------------------
// Transformation steps
// ---------------------------------------------------------------------------

CodePoints RemoveAdversarial(const CodePoints& in) {
  CodePoints out;
  out.reserve(in.size());
  for (UChar32 c : in) {
    if (!IsAdversarial(c)) out.push_back(c);
  }
  return out;
}

// Punctuation, symbols, separators and remaining controls become '_'
CodePoints ReplaceProblematic(const CodePoints& in) {
  CodePoints out;
  out.reserve(in.size());
  for (UChar32 c : in) {
    out.push_back(IsAllowed(c) ? c : kUnderscore);
  }
  return out;
}

// Unanchored search for 8-4-4-4-12 hex with version [1-5] and variant [89ab].
bool ContainsUuid(const CodePoints& s) {
  if (s.size() < kUuidLength) return false;

  for (size_t start = 0; start + kUuidLength <= s.size(); ++start) {
    bool match = true;
    for (size_t i = 0; i < kUuidLength && match; ++i) {
      UChar32 c = s[start + i];
      if (i == 8 || i == 13 || i == 18 || i == 23) {
        match = (c == kHyphen);
      } else if (i == 14) {
        match = (c >= '1' && c <= '5');
      } else if (i == 19) {
        match = (c == '8' || c == '9' || c == 'a' || c == 'b' || c == 'A' || c == 'B');
      } else {
        match = IsHexDigit(c);
      }
    }
    if (match) return true;
  }
  return false;
}

// Word splitting on ASCII case transitions. Delimiters ('-', '_', whitespace)
// collapse into a single '_'; a delimiter in the final position is kept as is.
CodePoints SnakeCase(const CodePoints& s) {
  CodePoints out;
  out.reserve(s.size() + 3);

  UChar32 prev = 0;
  UChar32 curr = 0;
  for (UChar32 next : s) {
    if (IsWordDelimiter(curr)) {
      if (!IsWordDelimiter(prev)) out.push_back(kUnderscore);
    } else if (IsAsciiUpper(curr)) {
      if (IsAsciiLower(prev) || (IsAsciiUpper(prev) && IsAsciiLower(next))) {
        out.push_back(kUnderscore);
      }
      out.push_back(AsciiLower(curr));
    } else if (curr != 0) {
      out.push_back(AsciiLower(curr));
    }
    prev = curr;
    curr = next;
  }

  if (!s.empty()) {
    if (IsAsciiUpper(curr) && IsAsciiLower(prev) && prev != 0) {
      out.push_back(kUnderscore);
    }
    out.push_back(AsciiLower(curr));
  }
  return out;
}

void LowercaseInPlace(CodePoints* s) {
  for (UChar32& c : *s) c = u_tolower(c);
}

CodePoints KeepAllowed(const CodePoints& in) {
  CodePoints out;
  out.reserve(in.size());
  for (UChar32 c : in) {
    if (IsAllowed(c)) out.push_back(c);
  }
  return out;
}

CodePoints CollapseUnderscores(const CodePoints& in) {
  CodePoints out;
  out.reserve(in.size());
  bool prev_underscore = false;
  for (UChar32 c : in) {
    if (c == kUnderscore) {
      if (!prev_underscore) out.push_back(c);
      prev_underscore = true;
    } else {
      out.push_back(c);
      prev_underscore = false;
    }
  }
  return out;
}

CodePoints TrimUnderscores(const CodePoints& in) {
  size_t begin = 0;
  size_t end = in.size();
  while (begin < end && in[begin] == kUnderscore) ++begin;
  while (end > begin && in[end - 1] == kUnderscore) --end;
  return CodePoints(in.begin() + static_cast<std::ptrdiff_t>(begin),
                    in.begin() + static_cast<std::ptrdiff_t>(end));
}

bool HasTrailingDunderscore(std::string_view s) {
  return s.size() >= 2 && s[s.size() - 1] == '_' && s[s.size() - 2] == '_';
}

// The algorithm without post-condition checks.
rocksdb::Status NormalizeUnchecked(std::string_view raw, std::string* out) {
  // Underscore conventions are decided on the raw input
  const bool trailing_dunderscore = HasTrailingDunderscore(raw);
  const bool single_leading_underscore =
      raw.size() >= 2 && raw[0] == '_' && raw[1] != '_';
  const bool single_trailing_underscore =
      raw.size() >= 2 && raw[raw.size() - 1] == '_' && raw[raw.size() - 2] != '_';

  CodePoints cps;
  rocksdb::Status s = DecodeNfkc(raw, &cps);
  if (!s.ok()) return s;

  cps = ReplaceProblematic(RemoveAdversarial(cps));

  if (ContainsUuid(cps)) {
    LowercaseInPlace(&cps);
  } else {
    cps = SnakeCase(cps);
    LowercaseInPlace(&cps);
  }

  cps = TrimUnderscores(CollapseUnderscores(KeepAllowed(cps)));

  if (single_leading_underscore && (cps.empty() || cps.front() != kUnderscore)) {
    cps.insert(cps.begin(), kUnderscore);
  }

  if (trailing_dunderscore) {
    if (cps.size() < 2 || cps[cps.size() - 1] != kUnderscore ||
        cps[cps.size() - 2] != kUnderscore) {
      cps.push_back(kUnderscore);
      cps.push_back(kUnderscore);
    }
  } else if (single_trailing_underscore && (cps.empty() || cps.back() != kUnderscore)) {
    cps.push_back(kUnderscore);
  }

  if (cps.empty()) {
    return rocksdb::Status::InvalidArgument("identifier cannot be empty after sanitization");
  }

  *out = EncodeUtf8(cps);
  return rocksdb::Status::OK();
}

// RFC 3986 unreserved characters plus the sub-delimiters a path segment may
// carry unescaped.
inline bool IsPathSegmentSafe(unsigned char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) return true;
  switch (c) {
    case '-': case '_': case '.': case '~':
    case '$': case '&': case '+': case ':': case '=': case '@':
      return true;
    default:
      return false;
  }
}

inline int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

rocksdb::Status NormalizeIdentifier(std::string_view raw, std::string* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::string result;
  rocksdb::Status s = NormalizeUnchecked(raw, &result);
  if (!s.ok()) return s;

  if (internal::ContainsDisallowedCodePoint(result)) {
    return rocksdb::Status::Corruption(
        "internal error: result contains disallowed code points", result);
  }

  std::string again;
  s = NormalizeUnchecked(result, &again);
  if (!s.ok()) {
    return rocksdb::Status::Corruption(
        "internal error: result fails to normalize again: " + result, s.ToString());
  }
  // Title-case digraphs and dotted capital I can recompose after lowercasing
  if (again != result) {
    return rocksdb::Status::Corruption(
        "internal error: result is not idempotent: " + result, "renormalizes to " + again);
  }

  const std::string escaped = internal::PathEscape(result);
  std::string unescaped;
  s = internal::PathUnescape(escaped, &unescaped);
  if (!s.ok() || unescaped != result) {
    return rocksdb::Status::Corruption(
        "internal error: result is not URL-safe: " + result, "escapes to " + escaped);
  }

  *out = std::move(result);
  return rocksdb::Status::OK();
}

bool IsCanonicalIdentifier(std::string_view identifier) {
  std::string canonical;
  return NormalizeIdentifier(identifier, &canonical).ok() && canonical == identifier;
}

namespace internal {

std::string PathEscape(std::string_view s) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    if (IsPathSegmentSafe(c)) {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  return out;
}

rocksdb::Status PathUnescape(std::string_view s, std::string* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::string result;
  result.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '%') {
      result.push_back(s[i]);
      continue;
    }
    if (i + 2 >= s.size()) {
      return rocksdb::Status::InvalidArgument("truncated percent escape");
    }
    const int hi = HexValue(s[i + 1]);
    const int lo = HexValue(s[i + 2]);
    if (hi < 0 || lo < 0) {
      return rocksdb::Status::InvalidArgument("invalid percent escape");
    }
    result.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }

  *out = std::move(result);
  return rocksdb::Status::OK();
}

bool ContainsDisallowedCodePoint(std::string_view utf8) {
  icu::UnicodeString u = icu::UnicodeString::fromUTF8(
      icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
  for (int32_t i = 0; i < u.length();) {
    UChar32 c = u.char32At(i);
    if (IsAdversarial(c) || !IsAllowed(c)) return true;
    i += U16_LENGTH(c);
  }
  return false;
}

}  // namespace internal
}  // namespace pagekey
