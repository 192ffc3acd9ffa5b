#pragma once

#include <memory>
#include <string>

#include <noscrypt.h>

#include "nostrcast/signer/signer.hpp"

namespace nostrcast
{
namespace signer
{
/**
 * @brief A local signer backed by the noscrypt library.
 */
class NoscryptSigner : public ILocalSigner
{
public:
    /**
     * @brief Creates a signer with a freshly generated keypair.
     * @throws `std::runtime_error` if noscrypt could not be initialized or no valid key could be
     * generated.
     */
    NoscryptSigner();

    /**
     * @brief Creates a signer from an existing secret key, such as a restored session key.
     * @param privateKey The 32-byte secret key, as hex.
     * @throws `std::invalid_argument` if the key is not a valid secp256k1 secret key.
     */
    explicit NoscryptSigner(const std::string& privateKey);

    ~NoscryptSigner();

    std::string publicKey() const override;

    /**
     * @brief The signer's secret key, as hex.
     * @remark Exposed so that callers may persist the session key.  Handle with care.
     */
    std::string privateKey() const;

    void sign(std::shared_ptr<data::Event> event) override;

    std::string encrypt(const std::string& plaintext, const std::string& peerPubkey) override;

    std::string decrypt(const std::string& payload, const std::string& peerPubkey) override;

private:
    std::shared_ptr<NCContext> _noscryptContext;

    std::shared_ptr<NCSecretKey> _localPrivateKey;

    std::shared_ptr<NCPublicKey> _localPublicKey;

    void _derivePublicKey();

    /**
     * @brief Parses a hex public key into noscrypt's key structure.
     * @returns The key, or `nullptr` if the hex string is not a 32-byte key.
     */
    static std::shared_ptr<NCPublicKey> _parsePublicKey(const std::string& pubkey);
};
} // namespace signer
} // namespace nostrcast
