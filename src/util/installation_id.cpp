#include "util/installation_id.hpp"

#include "util/logger.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace extupd {

namespace {

std::string HexEncode(const std::uint8_t* bytes, size_t n) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(kHex[(bytes[i] >> 4) & 0xF]);
        out.push_back(kHex[bytes[i] & 0xF]);
    }
    return out;
}

std::string TrimLine(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

} // namespace

Result GenerateUuidV4(std::string& out) {
    std::array<std::uint8_t, 16> b{};
    if (RAND_bytes(b.data(), static_cast<int>(b.size())) != 1) {
        return Result::Fail(-1, "RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }
    b[6] = static_cast<std::uint8_t>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<std::uint8_t>((b[8] & 0x3F) | 0x80);

    out = HexEncode(b.data(), 4) + "-" + HexEncode(b.data() + 4, 2) + "-" + HexEncode(b.data() + 6, 2) +
          "-" + HexEncode(b.data() + 8, 2) + "-" + HexEncode(b.data() + 10, 6);
    return Result::Ok();
}

Result LoadOrCreateInstallationId(const std::string& path, std::string& out) {
    out.clear();
    {
        std::ifstream is(path);
        if (is.good()) {
            std::string line;
            std::getline(is, line);
            out = TrimLine(line);
        }
    }
    if (!out.empty()) return Result::Ok();

    auto gen = GenerateUuidV4(out);
    if (!gen.is_ok()) return gen;

    const fs::path parent = fs::path(path).parent_path();
    std::error_code ec;
    if (!parent.empty()) fs::create_directories(parent, ec);

    const std::string tmp_path = path + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good()) {
        return Result::Fail(ErrorKind::IOFailure, "cannot write installation id: " + tmp_path);
    }
    os << out << "\n";
    os.close();
    if (!os) {
        return Result::Fail(ErrorKind::IOFailure, "cannot write installation id: " + tmp_path);
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        return Result::Fail(ErrorKind::IOFailure, "cannot store installation id at " + path);
    }

    LogInfo("Created installation id %s", out.c_str());
    return Result::Ok();
}

} // namespace extupd
