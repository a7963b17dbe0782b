#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace squirrel::crypto {

// Interface for streaming digest implementations
class IHasher {
public:
    virtual ~IHasher() = default;

    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    // Returns the lowercase hex digest and resets for reuse.
    virtual std::string finalize() = 0;

    void update(std::string_view text) { update(std::as_bytes(std::span(text.data(), text.size()))); }
};

// SHA-256 implementation
class SHA256Hasher : public IHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    using IHasher::update;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    // Static utilities for one-shot hashing
    static std::string hash(std::span<const std::byte> data);
    static std::string hashString(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Factory function
std::unique_ptr<IHasher> createSHA256Hasher();

} // namespace squirrel::crypto
