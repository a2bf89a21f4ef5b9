#pragma once

#include "selfupdate/io/reader.hpp"
#include "selfupdate/util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace selfupdate {

std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(IReader& reader);
Result Sha256HexFile(const std::string& path, std::string& out_hex);

// Lower-cases a hex digest and drops an optional "sha256:" prefix.
std::string NormalizeSha256(std::string_view digest);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    // Empty on any OpenSSL failure. The hasher is spent afterwards.
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace selfupdate
