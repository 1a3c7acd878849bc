#pragma once

#include <string>
#include <string_view>

#include <rocksdb/status.h>

namespace pagekey {

/**
 * Storage key for a page identifier.
 *
 * The identifier is lowercased code point by code point and encoded as
 * unpadded RFC 4648 base32, so every key is a safe file name and two
 * identifiers that differ only in case share one storage slot.
 */
std::string StorageKeyFor(std::string_view identifier);

/**
 * Decode a storage key back to the (lowercased) identifier it was derived from.
 * Returns InvalidArgument if the key is not valid base32 or not valid UTF-8.
 */
rocksdb::Status IdentifierFromStorageKey(std::string_view key, std::string* out);

}  // namespace pagekey
