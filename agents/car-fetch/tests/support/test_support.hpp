#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace testing_support {

namespace fs = std::filesystem;

class TempDir {
    fs::path path_;
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = fs::temp_directory_path() / ("car_fetch_test_" + std::to_string(gen()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }
};

inline std::string encode_uvarint(std::uint64_t v) {
    std::string out;
    while (v >= 0x80) {
        out.push_back(static_cast<char>((v & 0x7f) | 0x80));
        v >>= 7;
    }
    out.push_back(static_cast<char>(v));
    return out;
}

// Header prefix + header, then one prefixed section per entry of `sections`.
// Section bodies are filled with `fill`.
inline std::string build_car(std::uint64_t header_len, const std::vector<std::uint64_t>& sections, char fill = 'x') {
    std::string out = encode_uvarint(header_len) + std::string(header_len, 'h');
    for (auto len : sections) {
        out += encode_uvarint(len);
        out += std::string(len, fill);
    }
    return out;
}

inline void write_file(const fs::path& p, const std::string& bytes) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f.write(bytes.data(), (std::streamsize)bytes.size());
}

inline std::string read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace testing_support
