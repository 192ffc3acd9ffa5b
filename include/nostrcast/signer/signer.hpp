#pragma once

#include <memory>
#include <string>

#include "nostrcast/data/data.hpp"

namespace nostrcast
{
namespace signer
{
/**
 * @brief An interface for Nostr event signing.
 */
class ISigner
{
public:
    virtual ~ISigner() = default;

    /**
     * @brief Signs the given Nostr event.
     * @param event The event to sign.
     * @remark The event's `pubkey`, `id`, and `sig` fields are updated in-place.
     * @throws `std::runtime_error` if the event could not be signed.
     */
    virtual void sign(std::shared_ptr<data::Event> event) = 0;
};

/**
 * @brief A signer that holds its secret key in-process and can encrypt messages to peers.
 * @remark The remote signer client uses a local signer as its ephemeral session identity:
 * every RPC message is encrypted to the counterpart and signed with this key.
 */
class ILocalSigner : public ISigner
{
public:
    /**
     * @brief The signer's public key, as lowercase hex.
     */
    virtual std::string publicKey() const = 0;

    /**
     * @brief Encrypts a message for a peer according to NIP-44.
     * @param plaintext The message to encrypt.
     * @param peerPubkey The hex public key of the recipient.
     * @returns The base64 payload, or an empty string if the input could not be encrypted.
     */
    virtual std::string encrypt(const std::string& plaintext, const std::string& peerPubkey) = 0;

    /**
     * @brief Decrypts a NIP-44 payload received from a peer.
     * @param payload The base64 payload.
     * @param peerPubkey The hex public key of the sender.
     * @returns The plaintext, or an empty string if the payload could not be decrypted.
     */
    virtual std::string decrypt(const std::string& payload, const std::string& peerPubkey) = 0;
};
} // namespace signer
} // namespace nostrcast
