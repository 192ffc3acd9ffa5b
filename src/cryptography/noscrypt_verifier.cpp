#include <cstring>

#include <plog/Log.h>

#include "nostrcast/cryptography/signature_verifier.hpp"
#include "nostrcast/util/encoding.hpp"
#include "../internal/noscrypt_context.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace nostrcast;
using namespace nostrcast::cryptography;
using namespace std;

NoscryptVerifier::NoscryptVerifier()
{
    this->_libContext = internal::createNoscryptContext();
};

bool NoscryptVerifier::verify(
    const string& pubkey,
    const string& digest,
    const string& signature) const
{
    if (!util::isHex(pubkey, NC_PUBKEY_SIZE * 2)
        || !util::isHex(digest, 64)
        || !util::isHex(signature, NC_SIGNATURE_SIZE * 2))
    {
        PLOG_DEBUG << "Rejecting signature with malformed key, digest, or signature.";
        return false;
    }

    NCPublicKey publicKey;
    auto pubkeyBytes = util::fromHex(pubkey);
    memcpy(publicKey.key, pubkeyBytes.data(), NC_PUBKEY_SIZE);

    auto digestBytes = util::fromHex(digest);
    auto signatureBytes = util::fromHex(signature);

    NCResult result = NCVerifyDigest(
        this->_libContext.get(),
        &publicKey,
        digestBytes.data(),
        signatureBytes.data());

    // An invalid signature is a normal outcome; only argument errors are worth logging.
    uint8_t argPosition = 0;
    if (result != NC_SUCCESS && NCParseErrorCode(result, &argPosition) != E_OPERATION_FAILED)
    {
        NOSTRCAST_LOG_NC_ERROR(result);
    }

    return result == NC_SUCCESS;
};
