#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace agentnet::crypto
{

    using Bytes = std::vector<uint8_t>;
    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>;
    using Ed25519Signature = std::array<uint8_t, 64>;
    using Ed25519Seed = std::array<uint8_t, 32>;

    /**
     * Ed25519 key pair used to sign votes and consensus messages
     */
    class Ed25519KeyPair
    {
    public:
        Ed25519PublicKey public_key;
        Ed25519SecretKey secret_key;

        /**
         * Generate a new random key pair
         */
        static Result<Ed25519KeyPair> generate();

        /**
         * Derive a key pair deterministically from a 32-byte seed
         */
        static Result<Ed25519KeyPair> from_seed(const Ed25519Seed &seed);

        /**
         * Sign a message, returns 64-byte detached signature
         */
        Ed25519Signature sign(const Bytes &message) const;

        /**
         * Verify a detached signature against message and public key
         */
        static bool verify(
            const Bytes &message,
            const Ed25519Signature &signature,
            const Ed25519PublicKey &public_key);

        /** Base64 (standard alphabet) of the public key */
        std::string public_key_b64() const;
    };

    class Base64
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(const std::string &encoded);
    };

    class Hex
    {
    public:
        /** Lower-case hex encoding */
        static std::string encode(const Bytes &data);
    };

    /**
     * Cryptographically secure random number generation (libsodium CSPRNG)
     */
    class SecureRandom
    {
    public:
        static Bytes generate_bytes(size_t n);

        /** 128 random bits rendered as 32 lower-case hex characters */
        static std::string random_id();
    };

} // namespace agentnet::crypto
