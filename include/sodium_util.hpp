#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace raffle {

// Throws std::runtime_error when libsodium cannot be initialized.
void requireSodium();

void secureZero(void* ptr, std::size_t numBytes);

std::string bytesToHex(const unsigned char* data, std::size_t len);
std::vector<unsigned char> hexToBytes(const std::string& hex);

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);
std::string secureRandomHex(std::size_t numBytes);

// Holds key material and wipes it on destruction.
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(std::vector<unsigned char> bytes) : bytes_(std::move(bytes)) {}

    SecretBytes(const SecretBytes&) = delete;
    SecretBytes& operator=(const SecretBytes&) = delete;

    SecretBytes(SecretBytes&& other) noexcept : bytes_(std::move(other.bytes_)) {
        other.bytes_.clear();
    }

    SecretBytes& operator=(SecretBytes&& other) noexcept {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    ~SecretBytes() { wipe(); }

    const unsigned char* data() const { return bytes_.data(); }
    std::size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

private:
    void wipe() {
        if (!bytes_.empty()) {
            secureZero(bytes_.data(), bytes_.size());
        }
    }

    std::vector<unsigned char> bytes_;
};

} // namespace raffle
