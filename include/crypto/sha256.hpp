#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace onova {

// Incremental SHA-256 over OpenSSL EVP. Finalizing twice yields "".
class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string Sha256Hex(std::string_view data);
Result Sha256HexFile(const std::string& path, std::string& out_hex);

// Case-insensitive hex digest comparison.
bool DigestEquals(std::string_view a, std::string_view b);

} // namespace onova
