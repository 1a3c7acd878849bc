#include <pagekey/page_key.hpp>

#include <pagekey/internal.hpp>

#include <cstdint>
#include <utility>

#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>
#include <unicode/utf8.h>

namespace pagekey {

namespace internal {

std::string Utf8ToLower(std::string_view utf8) {
  icu::UnicodeString u = icu::UnicodeString::fromUTF8(
      icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
  icu::UnicodeString lowered;
  for (int32_t i = 0; i < u.length();) {
    UChar32 c = u.char32At(i);
    lowered.append(u_tolower(c));
    i += U16_LENGTH(c);
  }
  std::string out;
  lowered.toUTF8String(out);
  return out;
}

}  // namespace internal

namespace {

bool IsValidUtf8(std::string_view s) {
  const auto* p = reinterpret_cast<const uint8_t*>(s.data());
  const int32_t len = static_cast<int32_t>(s.size());
  for (int32_t i = 0; i < len;) {
    UChar32 c;
    U8_NEXT(p, i, len, c);
    if (c < 0) return false;
  }
  return true;
}

}  // namespace

std::string StorageKeyFor(std::string_view identifier) {
  return internal::Base32Encode(internal::Utf8ToLower(identifier));
}

rocksdb::Status IdentifierFromStorageKey(std::string_view key, std::string* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (key.empty()) return rocksdb::Status::InvalidArgument("storage key is empty");

  std::string decoded;
  rocksdb::Status s = internal::Base32Decode(key, &decoded);
  if (!s.ok()) return s;

  if (!IsValidUtf8(decoded)) {
    return rocksdb::Status::InvalidArgument("storage key does not decode to UTF-8",
                                            std::string(key));
  }

  *out = std::move(decoded);
  return rocksdb::Status::OK();
}

}  // namespace pagekey
