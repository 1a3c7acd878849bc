#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <rocksdb/status.h>

namespace pagekey::internal {

// Monotonic timestamp helper for metrics (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// Wall-clock seconds since epoch; names the soft-delete holding folders.
inline uint64_t WallClockSeconds() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

// Transaction conflicts worth another attempt.
inline bool IsRetryableTxnStatus(const rocksdb::Status& s) {
  return s.IsBusy() || s.IsTimedOut() || s.IsTryAgain() || s.IsAborted();
}

// ---------------------------------------------------------------------------
// Base32 (RFC 4648 standard encoding, '=' padded to 8-character blocks)
// ---------------------------------------------------------------------------

inline constexpr char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

inline std::string Base32Encode(std::string_view data) {
  std::string out;
  out.reserve((data.size() + 4) / 5 * 8);

  uint32_t buffer = 0;
  int bits = 0;
  for (char ch : data) {
    buffer = (buffer << 8) | static_cast<uint8_t>(ch);
    bits += 8;
    while (bits >= 5) {
      out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1f]);
      bits -= 5;
    }
  }
  if (bits > 0) {
    out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1f]);
  }
  while (out.size() % 8 != 0) out.push_back('=');
  return out;
}

inline int Base32Value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= '2' && c <= '7') return c - '2' + 26;
  return -1;
}

inline rocksdb::Status Base32Decode(std::string_view encoded, std::string* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  // Padding is optional on input
  while (!encoded.empty() && encoded.back() == '=') encoded.remove_suffix(1);

  std::string result;
  result.reserve(encoded.size() * 5 / 8);

  uint32_t buffer = 0;
  int bits = 0;
  for (char c : encoded) {
    const int v = Base32Value(c);
    if (v < 0) {
      return rocksdb::Status::InvalidArgument("invalid base32 character",
                                              std::string(1, c));
    }
    buffer = (buffer << 5) | static_cast<uint32_t>(v);
    bits += 5;
    if (bits >= 8) {
      result.push_back(static_cast<char>((buffer >> (bits - 8)) & 0xff));
      bits -= 8;
    }
  }
  // Leftover bits must be zero padding
  if (bits >= 5 || (buffer & ((1u << bits) - 1)) != 0) {
    return rocksdb::Status::InvalidArgument("invalid base32 length or trailing bits");
  }

  *out = std::move(result);
  return rocksdb::Status::OK();
}

// Append one code point as UTF-8. Returns false for surrogates and values
// above U+10FFFF.
inline bool AppendUtf8(uint32_t cp, std::string* out) {
  if (cp >= 0xD800 && cp <= 0xDFFF) return false;
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0x10FFFF) {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    return false;
  }
  return true;
}

// Parse exactly `digits` hex characters starting at `pos`.
inline bool ParseHex(std::string_view s, size_t pos, size_t digits, uint32_t* out) {
  if (pos + digits > s.size()) return false;
  uint32_t v = 0;
  for (size_t i = pos; i < pos + digits; ++i) {
    const char c = s[i];
    v <<= 4;
    if (c >= '0' && c <= '9') {
      v |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      v |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      v |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return false;
    }
  }
  *out = v;
  return true;
}

inline std::string_view TrimView(std::string_view s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

inline bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Per-code-point simple lowercase mapping (UTF-8 in, UTF-8 out).
std::string Utf8ToLower(std::string_view utf8);

}  // namespace pagekey::internal
