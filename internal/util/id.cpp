#include "id.hpp"

#include <array>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

#include "time.hpp"

namespace stockroom::util {

namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

std::string Base36(std::uint64_t value) {
  static constexpr char kDigits[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
  if (value == 0) return "0";
  std::string out;
  while (value > 0) {
    out.insert(out.begin(), kDigits[value % 36]);
    value /= 36;
  }
  return out;
}

} // namespace

std::string GenerateUUIDv7() {
  // RFC 9562 method 1: rand_a holds a 12-bit counter so ids generated
  // within the same millisecond still sort in creation order.
  static std::mutex    mu;
  static std::uint64_t last_ms  = 0;
  static std::uint16_t sequence = 0;

  std::uint64_t ms;
  std::uint16_t seq;
  {
    std::lock_guard<std::mutex> lock(mu);
    ms = static_cast<std::uint64_t>(ToUnixMillis(Now()));
    if (ms <= last_ms) {
      ms = last_ms;
      if (++sequence > 0x0FFF) {
        ++ms;
        sequence = 0;
      }
    } else {
      sequence = 0;
    }
    last_ms = ms;
    seq     = sequence;
  }

  std::array<std::uint8_t, 16> id{};
  for (int i = 0; i < 6; ++i) {
    id[i] = static_cast<std::uint8_t>(ms >> (8 * (5 - i)));
  }
  for (std::size_t i = 8; i < id.size(); ++i) {
    id[i] = static_cast<std::uint8_t>(Rng()());
  }

  // RFC 9562 version 7 + variant
  id[6] = static_cast<std::uint8_t>(0x70 | ((seq >> 8) & 0x0F));
  id[7] = static_cast<std::uint8_t>(seq & 0xFF);
  id[8] = (id[8] & 0x3F) | 0x80;

  std::ostringstream oss;
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

std::string PrefixedId(std::string_view prefix) {
  return std::string(prefix) + "_" + GenerateUUIDv7();
}

std::string GeneratePublicCode(std::size_t size) {
  std::uniform_int_distribution<std::size_t> pick(0, kPublicAlphabet.size() - 1);

  std::string code;
  code.reserve(size);
  for (std::size_t i = 0; i < size; ++i) {
    code.push_back(kPublicAlphabet[pick(Rng())]);
  }
  return code;
}

std::string GenerateUniquePublicRef(std::string_view prefix, std::size_t size, const std::function<bool(const std::string&)>& taken) {
  for (int attempt = 0; attempt < 50; ++attempt) {
    auto ref = std::string(prefix) + GeneratePublicCode(size);
    if (!taken(ref)) {
      return ref;
    }
  }
  return std::string(prefix) + Base36(static_cast<std::uint64_t>(ToUnixMillis(Now())));
}

} // namespace stockroom::util
