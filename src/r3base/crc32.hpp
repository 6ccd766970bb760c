#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

namespace r3::util {

// crc-32 (ieee 802.3, reflected, poly 0xedb88320)
uint32_t crc32(std::span<const uint8_t> data, uint32_t seed = 0);

// hashes the full contents of a file; returns 0 when the file cannot be read
uint32_t hash_file(const std::filesystem::path& path);

} // namespace r3::util
