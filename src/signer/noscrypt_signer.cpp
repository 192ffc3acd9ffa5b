#include <cstring>
#include <stdexcept>

#include <plog/Log.h>
#include <noscryptutil.h>

#include "nostrcast/cryptography/noscrypt_cipher.hpp"
#include "nostrcast/signer/noscrypt_signer.hpp"
#include "nostrcast/util/encoding.hpp"
#include "../cryptography/nostr_secure_rng.hpp"
#include "../internal/noscrypt_context.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace nostrcast;
using namespace nostrcast::cryptography;
using namespace nostrcast::data;
using namespace nostrcast::signer;
using namespace std;

#pragma region Local Statics

/**
 * @brief Generates a secret key for local use.
 * @remarks This key is intended for the lifetime of a remote signing session, and is not the
 * user's identity key.
 */
static void createLocalSecretKey(
    const shared_ptr<const NCContext> ctx,
    shared_ptr<NCSecretKey> secret
)
{
    // Loop attempts to generate a secret key until a valid key is produced.
    // Limit the number of attempts to prevent resource exhaustion in the event of a failure.
    NCResult secretValidationResult;
    int loopCount = 0;
    do
    {
        NostrSecureRng::fill(secret.get(), sizeof(NCSecretKey));

        secretValidationResult = NCValidateSecretKey(ctx.get(), secret.get());

    } while (secretValidationResult != NC_SUCCESS && ++loopCount < 64);

    if (secretValidationResult != NC_SUCCESS)
    {
        NOSTRCAST_LOG_NC_ERROR(secretValidationResult);
        throw runtime_error("Failed to generate a valid secret key.");
    }
};

#pragma endregion

#pragma region Constructors and Destructors

NoscryptSigner::NoscryptSigner()
{
    this->_noscryptContext = internal::createNoscryptContext();
    this->_localPrivateKey = make_shared<NCSecretKey>();
    this->_localPublicKey = make_shared<NCPublicKey>();

    createLocalSecretKey(this->_noscryptContext, this->_localPrivateKey);
    this->_derivePublicKey();
};

NoscryptSigner::NoscryptSigner(const string& privateKey)
{
    if (!util::isHex(privateKey, NC_SEC_KEY_SIZE * 2))
    {
        throw invalid_argument("NoscryptSigner: The private key must be 32 bytes of hex.");
    }

    this->_noscryptContext = internal::createNoscryptContext();
    this->_localPrivateKey = make_shared<NCSecretKey>();
    this->_localPublicKey = make_shared<NCPublicKey>();

    auto keyBytes = util::fromHex(privateKey);
    memcpy(this->_localPrivateKey->key, keyBytes.data(), NC_SEC_KEY_SIZE);
    NostrSecureRng::zero(keyBytes);

    NCResult validationResult = NCValidateSecretKey(
        this->_noscryptContext.get(),
        this->_localPrivateKey.get());
    if (validationResult != NC_SUCCESS)
    {
        NOSTRCAST_LOG_NC_ERROR(validationResult);
        throw invalid_argument("NoscryptSigner: The private key is not a valid secret key.");
    }

    this->_derivePublicKey();
};

NoscryptSigner::~NoscryptSigner()
{
    if (this->_localPrivateKey)
    {
        NostrSecureRng::zero(this->_localPrivateKey.get(), sizeof(NCSecretKey));
    }
};

#pragma endregion

#pragma region Public Interface

string NoscryptSigner::publicKey() const
{
    return util::toHex(this->_localPublicKey->key, sizeof(NCPublicKey));
};

string NoscryptSigner::privateKey() const
{
    return util::toHex(this->_localPrivateKey->key, sizeof(NCSecretKey));
};

void NoscryptSigner::sign(shared_ptr<Event> event)
{
    if (event == nullptr)
    {
        throw invalid_argument("NoscryptSigner::sign: The event must not be null.");
    }

    event->pubkey = this->publicKey();

    // Serializing validates the event and computes its ID.
    event->serialize();
    auto digest = util::fromHex(event->id);

    uint8_t schnorrSig[NC_SIGNATURE_SIZE];
    uint8_t random32[32];

    NostrSecureRng::fill(random32, sizeof(random32));

    NCResult signatureResult = NCSignDigest(
        this->_noscryptContext.get(),
        this->_localPrivateKey.get(),
        random32,
        digest.data(),
        schnorrSig
    );

    // Random buffer could leak sensitive signing information
    NostrSecureRng::zero(random32, sizeof(random32));

    if (signatureResult != NC_SUCCESS)
    {
        NOSTRCAST_LOG_NC_ERROR(signatureResult);
        throw runtime_error("NoscryptSigner::sign: Failed to sign the event.");
    }

    event->sig = util::toHex(schnorrSig, sizeof(schnorrSig));
};

string NoscryptSigner::encrypt(const string& plaintext, const string& peerPubkey)
{
    auto remoteKey = _parsePublicKey(peerPubkey);
    if (remoteKey == nullptr)
    {
        PLOG_ERROR << "Cannot encrypt for malformed public key " << peerPubkey;
        return string();
    }

    NoscryptCipher cipher(NC_ENC_VERSION_NIP44, NC_UTIL_CIPHER_MODE_ENCRYPT);

    auto output = cipher.update(
        this->_noscryptContext,
        this->_localPrivateKey,
        remoteKey,
        plaintext
    );

    return output.empty()
        ? string()
        : NoscryptCipher::encodeBase64(output);
};

string NoscryptSigner::decrypt(const string& payload, const string& peerPubkey)
{
    auto remoteKey = _parsePublicKey(peerPubkey);
    if (remoteKey == nullptr)
    {
        PLOG_ERROR << "Cannot decrypt from malformed public key " << peerPubkey;
        return string();
    }

    string rawPayload;
    try
    {
        rawPayload = NoscryptCipher::decodeBase64(payload);
    }
    catch (const invalid_argument& e)
    {
        PLOG_WARNING << "Discarding undecodable NIP-44 payload: " << e.what();
        return string();
    }

    NoscryptCipher cipher(NC_ENC_VERSION_NIP44, NC_UTIL_CIPHER_MODE_DECRYPT);

    return cipher.update(
        this->_noscryptContext,
        this->_localPrivateKey,
        remoteKey,
        rawPayload
    );
};

#pragma endregion

#pragma region Private Helpers

void NoscryptSigner::_derivePublicKey()
{
    NCResult pubkeyGenerationResult = NCGetPublicKey(
        this->_noscryptContext.get(),
        this->_localPrivateKey.get(),
        this->_localPublicKey.get());

    if (pubkeyGenerationResult != NC_SUCCESS)
    {
        NOSTRCAST_LOG_NC_ERROR(pubkeyGenerationResult);
        throw runtime_error("Failed to derive the local public key.");
    }
};

shared_ptr<NCPublicKey> NoscryptSigner::_parsePublicKey(const string& pubkey)
{
    if (!util::isHex(pubkey, NC_PUBKEY_SIZE * 2))
    {
        return nullptr;
    }

    auto key = make_shared<NCPublicKey>();
    auto keyBytes = util::fromHex(pubkey);
    memcpy(key->key, keyBytes.data(), NC_PUBKEY_SIZE);

    return key;
};

#pragma endregion
