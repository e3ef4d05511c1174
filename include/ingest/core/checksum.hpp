#pragma once

#include "ingest/core/result.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace ingest {

/**
 * @brief Streaming 64-bit FNV-1a hasher
 *
 * Fed chunk by chunk while a file is read, so the source checksum is known
 * the moment the last byte is written. Digests render as 16 lowercase hex
 * characters.
 */
class Fnv1a64 {
public:
    static constexpr std::uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
    static constexpr std::uint64_t kPrime = 0x100000001b3ULL;

    void update(const void* data, std::size_t size) noexcept;
    void update(std::string_view data) noexcept { update(data.data(), data.size()); }

    [[nodiscard]] std::uint64_t digest() const noexcept { return state_; }
    [[nodiscard]] std::string hex_digest() const;

    void reset() noexcept { state_ = kOffsetBasis; }

private:
    std::uint64_t state_ = kOffsetBasis;
};

std::string to_hex(std::uint64_t value);

/// Hashes a whole string in one call.
std::string checksum_bytes(std::string_view data);

/**
 * @brief Hashes a file on disk
 *
 * Returns a Cancelled error if @p cancel becomes true between chunks.
 */
Result<std::string> checksum_file(const std::filesystem::path& path,
                                  std::size_t buffer_size = 64 * 1024,
                                  const std::atomic<bool>* cancel = nullptr);

} // namespace ingest
