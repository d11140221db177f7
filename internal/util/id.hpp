#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace stockroom::util {

/*
  Identifier helpers

  Internal ids are UUIDv7 strings (48-bit unix-ms prefix, so ids sort by
  creation time). Public references are short codes meant to be read aloud
  at the till.
*/

std::string GenerateUUIDv7();

// "<prefix>_<uuidv7>", e.g. prod_0190f1c2-...
std::string PrefixedId(std::string_view prefix);

// Alphabet without 0/O/1/I/L.
inline constexpr std::string_view kPublicAlphabet = "23456789ABCDEFGHJKLMNPQRSTUVWXYZ";

std::string GeneratePublicCode(std::size_t size);

// Retries until `taken` rejects nothing; falls back to a base36 timestamp
// after 50 collisions.
std::string GenerateUniquePublicRef(std::string_view prefix, std::size_t size, const std::function<bool(const std::string&)>& taken);

} // namespace stockroom::util
