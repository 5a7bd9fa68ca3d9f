#include "agentnet/crypto.hpp"
#include <sodium.h>

namespace agentnet::crypto
{
    namespace
    {
        constexpr int kBase64Variant = sodium_base64_VARIANT_ORIGINAL;
        constexpr std::size_t kIdBytes = 16;

        // sodium_init() is idempotent and thread-safe; every entry point that
        // touches the CSPRNG or key generation goes through here first.
        struct SodiumRuntime
        {
            SodiumRuntime()
            {
                if (sodium_init() < 0)
                    throw std::runtime_error("libsodium could not be initialised");
            }
        };

        const SodiumRuntime sodium_runtime;
    } // namespace

    Result<Ed25519KeyPair> Ed25519KeyPair::generate()
    {
        Ed25519KeyPair kp;
        if (crypto_sign_keypair(kp.public_key.data(), kp.secret_key.data()) != 0)
            return std::unexpected(ConsensusError::crypto("node key generation failed"));
        return kp;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_seed(const Ed25519Seed &seed)
    {
        Ed25519KeyPair kp;
        if (crypto_sign_seed_keypair(kp.public_key.data(), kp.secret_key.data(), seed.data()) != 0)
            return std::unexpected(ConsensusError::crypto("node key derivation from seed failed"));
        return kp;
    }

    Ed25519Signature Ed25519KeyPair::sign(const Bytes &message) const
    {
        Ed25519Signature sig{};
        crypto_sign_detached(sig.data(), nullptr, message.data(), message.size(), secret_key.data());
        return sig;
    }

    bool Ed25519KeyPair::verify(const Bytes &message,
                                const Ed25519Signature &signature,
                                const Ed25519PublicKey &public_key)
    {
        return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                           public_key.data()) == 0;
    }

    std::string Ed25519KeyPair::public_key_b64() const
    {
        return Base64::encode(Bytes(public_key.begin(), public_key.end()));
    }

    std::string Base64::encode(const Bytes &data)
    {
        // encoded_len counts the trailing NUL that sodium writes
        const auto with_nul = sodium_base64_encoded_len(data.size(), kBase64Variant);
        std::string out(with_nul, '\0');
        sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), kBase64Variant);
        out.resize(with_nul - 1);
        return out;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes out(encoded.size() / 4 * 3 + 3);
        std::size_t written = 0;
        const int rc = sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(),
                                         nullptr, &written, nullptr, kBase64Variant);
        if (rc != 0)
            return std::unexpected(ConsensusError::crypto("malformed base64"));
        out.resize(written);
        return out;
    }

    std::string Hex::encode(const Bytes &data)
    {
        std::string out(data.size() * 2 + 1, '\0');
        sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
        out.pop_back();
        return out;
    }

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes out(n);
        randombytes_buf(out.data(), out.size());
        return out;
    }

    std::string SecureRandom::random_id()
    {
        return Hex::encode(generate_bytes(kIdBytes));
    }

} // namespace agentnet::crypto
