#include "r3base/crc32.hpp"

#include <array>
#include <fstream>
#include <vector>

namespace r3::util {
namespace {

constexpr uint32_t kPolynomial = 0xedb88320u;
constexpr size_t kReadChunk = 64 * 1024;

constexpr std::array<uint32_t, 256> make_table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t value = i;
    for (int bit = 0; bit < 8; ++bit) {
      value = (value & 1u) ? (kPolynomial ^ (value >> 1)) : (value >> 1);
    }
    table[i] = value;
  }
  return table;
}

constexpr auto kTable = make_table();

uint32_t update(uint32_t state, const uint8_t* data, size_t size) {
  for (size_t i = 0; i < size; ++i) {
    state = kTable[(state ^ data[i]) & 0xffu] ^ (state >> 8);
  }
  return state;
}

} // namespace

uint32_t crc32(std::span<const uint8_t> data, uint32_t seed) {
  uint32_t state = ~seed;
  state = update(state, data.data(), data.size());
  return ~state;
}

uint32_t hash_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return 0;
  }

  std::vector<uint8_t> buffer(kReadChunk);
  uint32_t state = ~0u;
  while (file) {
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    const auto count = file.gcount();
    if (count <= 0) {
      break;
    }
    state = update(state, buffer.data(), static_cast<size_t>(count));
  }

  if (file.bad()) {
    return 0;
  }
  return ~state;
}

} // namespace r3::util
