#include "../include/car_scan.hpp"
#include "../include/errors.hpp"
#include <fstream>
#include <limits>

namespace fs = std::filesystem;

std::optional<std::uint64_t> read_uvarint(std::istream& in, std::size_t* consumed) {
    std::uint64_t x = 0;
    unsigned shift = 0;
    std::size_t n = 0;
    for (;;) {
        int c = in.get();
        if (c == std::char_traits<char>::eof()) return std::nullopt;
        ++n;
        auto b = static_cast<std::uint8_t>(c);
        if (shift == 63 && (b & 0x7f) > 1) return std::nullopt;
        x |= static_cast<std::uint64_t>(b & 0x7f) << shift;
        if (b < 0x80) break;
        shift += 7;
        if (shift > 63) return std::nullopt;
    }
    if (consumed) *consumed = n;
    return x;
}

std::uint64_t find_zero_length_offset(const fs::path& car) {
    std::error_code ec;
    const std::uint64_t size = fs::file_size(car, ec);
    if (ec) throw FetchError(ErrorKind::io, "cannot stat " + car.string() + ": " + ec.message());
    std::ifstream in(car, std::ios::binary);
    if (!in) throw FetchError(ErrorKind::io, "cannot open " + car.string());

    std::uint64_t pos = 0;
    std::size_t used = 0;
    auto header = read_uvarint(in, &used);
    if (!header || *header == 0) {
        throw FetchError(ErrorKind::no_header, "no CAR header length prefix in " + car.string());
    }
    pos += used;

    auto skip = [&](std::uint64_t n) {
        if (n > size - pos || n > (std::uint64_t)std::numeric_limits<std::streamoff>::max()) {
            throw FetchError(ErrorKind::truncated_section,
                             "section at offset " + std::to_string(pos) + " runs past end of " + car.string());
        }
        in.seekg(static_cast<std::streamoff>(n), std::ios::cur);
        if (!in) throw FetchError(ErrorKind::io, "seek failed in " + car.string());
        pos += n;
    };

    skip(*header);
    for (;;) {
        const std::uint64_t section_start = pos;
        auto len = read_uvarint(in, &used);
        if (!len) {
            throw FetchError(ErrorKind::truncated_section,
                             "no zero-length section before end of " + car.string() +
                                 " (stopped at offset " + std::to_string(section_start) + ")");
        }
        if (*len == 0) return section_start;
        pos += used;
        skip(*len);
    }
}
