#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace daemux::crypto {

// Interface for incremental digests
class IHasher {
public:
    virtual ~IHasher() = default;

    virtual void update(std::span<const std::byte> data) = 0;
    // Returns the lowercase hex digest and resets the hasher for reuse
    virtual std::string finalize() = 0;

    void update(std::string_view text) { update(std::as_bytes(std::span{text.data(), text.size()})); }
};

// SHA-256 implementation
class SHA256Hasher : public IHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher() override;

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void update(std::span<const std::byte> data) override;
    using IHasher::update;
    std::string finalize() override;

private:
    void init();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

std::unique_ptr<IHasher> createSHA256Hasher();

} // namespace daemux::crypto
