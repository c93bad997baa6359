#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <filesystem>

// Unsigned LEB128: 7 payload bits per byte, high bit set on all but the last.
// nullopt when the stream ends mid-integer or the value does not fit 64 bits.
std::optional<std::uint64_t> read_uvarint(std::istream& in, std::size_t* consumed = nullptr);

// Offset of the first zero-length section prefix in a CARv1 file: the number
// of bytes to keep when cutting off the end-of-stream marker and any padding.
// Seeks over section bodies, never reads them.
// Throws FetchError(no_header | truncated_section | io).
std::uint64_t find_zero_length_offset(const std::filesystem::path& car);
