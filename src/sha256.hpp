// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace binauthz {

class Sha256 {
  public:
    using Digest = std::array<uint8_t, 32>;

    Sha256();

    void update(const void* data, size_t len);
    Digest finish();
    std::string finish_hex();

    static std::string hash_hex(const std::string& data);

  private:
    void transform(const uint8_t* block);

    std::array<uint32_t, 8> state_{};
    std::array<uint8_t, 64> buffer_{};
    size_t buffer_len_ = 0;
    uint64_t total_len_ = 0;
};

std::string digest_to_hex(const uint8_t* data, size_t len);

// Lowercase hex SHA-256 of a file's contents. Returns false if unreadable.
bool sha256_file_hex(const std::string& path, std::string& out);

} // namespace binauthz
