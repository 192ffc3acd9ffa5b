#pragma once

#include <memory>
#include <string>

#include <noscrypt.h>

namespace nostrcast
{
namespace cryptography
{
/**
 * @brief An interface for verifying BIP-340 Schnorr signatures over 32-byte event IDs.
 */
class ISignatureVerifier
{
public:
    virtual ~ISignatureVerifier() = default;

    /**
     * @brief Verifies a signature.
     * @param pubkey The 32-byte x-only public key, as hex.
     * @param digest The 32-byte message digest (an event ID), as hex.
     * @param signature The 64-byte signature, as hex.
     * @returns True if the signature is valid.  Malformed input is reported as invalid.
     */
    virtual bool verify(
        const std::string& pubkey,
        const std::string& digest,
        const std::string& signature) const = 0;
};

class NoscryptVerifier : public ISignatureVerifier
{
public:
    /**
     * @throws `std::runtime_error` if the noscrypt context could not be initialized.
     */
    NoscryptVerifier();

    bool verify(
        const std::string& pubkey,
        const std::string& digest,
        const std::string& signature) const override;

private:
    std::shared_ptr<NCContext> _libContext;
};
} // namespace cryptography
} // namespace nostrcast
