#include "ingest/core/checksum.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace ingest {

void Fnv1a64::update(const void* data, std::size_t size) noexcept {
    const auto* bytes = static_cast<const unsigned char*>(data);
    std::uint64_t hash = state_;
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= static_cast<std::uint64_t>(bytes[i]);
        hash *= kPrime;
    }
    state_ = hash;
}

std::string Fnv1a64::hex_digest() const {
    return to_hex(state_);
}

std::string to_hex(std::uint64_t value) {
    std::ostringstream hex;
    hex << std::hex << std::setw(sizeof(value) * 2) << std::setfill('0') << value;
    return hex.str();
}

std::string checksum_bytes(std::string_view data) {
    Fnv1a64 hasher;
    hasher.update(data);
    return hasher.hex_digest();
}

Result<std::string> checksum_file(const std::filesystem::path& path,
                                  std::size_t buffer_size,
                                  const std::atomic<bool>* cancel) {
    if (buffer_size == 0) {
        return Err<std::string>(ErrorCode::Validation, "buffer_size must be > 0");
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::NotFound, "Failed to open file for hashing: " + path.string());
    }

    Fnv1a64 hasher;
    std::vector<char> buffer(buffer_size);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        if (cancel != nullptr && cancel->load()) {
            return Err<std::string>(ErrorCode::Cancelled, "Hashing cancelled: " + path.string());
        }
        hasher.update(buffer.data(), static_cast<std::size_t>(input.gcount()));
    }

    if (input.bad()) {
        return Err<std::string>(ErrorCode::Io, "Read failed while hashing: " + path.string());
    }
    return Ok(hasher.hex_digest());
}

} // namespace ingest
