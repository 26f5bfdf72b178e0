/**
 * chunkvault - Content hashing and random identifiers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace chunkvault::crypto
{

    void ensure_sodium_init();

    // Length in hex characters of every digest produced below.
    std::size_t digest_hex_length() noexcept;

    // Hex encoded random token of byte_count bytes.
    std::string random_token(std::size_t byte_count = 16);

    class StreamHasher
    {
    public:
        StreamHasher();
        ~StreamHasher();

        StreamHasher(const StreamHasher &) = delete;
        StreamHasher &operator=(const StreamHasher &) = delete;

        void update(std::span<const std::byte> data);

        // Consumes the state; further calls to update or finish throw.
        std::string finish();

    private:
        struct State;
        std::unique_ptr<State> state_;
        bool finished_{false};
    };

} // namespace chunkvault::crypto
