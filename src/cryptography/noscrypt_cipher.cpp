#include <stdexcept>

#include <plog/Init.h>
#include <plog/Log.h>

#include <openssl/evp.h>

#include "nostrcast/cryptography/noscrypt_cipher.hpp"
#include "nostr_secure_rng.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace std;
using namespace nostrcast::cryptography;

#pragma region Cipher Context

NoscryptCipherContext::NoscryptCipherContext(uint32_t version, uint32_t mode) : _mode(mode)
{
    this->_cipher = NCUtilCipherAlloc(
        version,
        mode | NC_UTIL_CIPHER_ZERO_ON_FREE | NC_UTIL_CIPHER_REUSEABLE
    );

    if (this->_cipher == nullptr)
    {
        throw runtime_error("Failed to allocate a noscrypt cipher context.");
    }
};

NoscryptCipherContext::~NoscryptCipherContext()
{
    // Also zeroes any data and pointers held by the context.
    NCUtilCipherFree(this->_cipher);
};

size_t NoscryptCipherContext::ivSize() const
{
    NCResult size = NCUtilCipherGetIvSize(this->_cipher);

    if (size <= 0)
    {
        NOSTRCAST_LOG_NC_ERROR(size);
        return 0;
    }

    return static_cast<size_t>(size);
};

#pragma endregion

#pragma region Cipher

NoscryptCipher::NoscryptCipher(uint32_t version, uint32_t mode) :
 _cipher(version, mode)
{
    /*
    * The nonce size is known once the cipher exists, so the buffer is allocated up front and
    * refilled with random data before each encryption.
    */
    if (mode == NC_UTIL_CIPHER_MODE_ENCRYPT)
    {
        this->_ivBuffer.resize(this->_cipher.ivSize());

        NCResult result = this->_cipher.setIV(this->_ivBuffer);
        if (result != NC_SUCCESS)
        {
            NOSTRCAST_LOG_NC_ERROR(result);
            throw runtime_error("Failed to assign the cipher nonce buffer.");
        }
    }
};

string NoscryptCipher::update(
    const shared_ptr<const NCContext> libContext,
    const shared_ptr<const NCSecretKey> localKey,
    const shared_ptr<const NCPublicKey> remoteKey,
    const string& input
)
{
    NCResult result;

    if (input.empty())
    {
        return string();
    }

    const vector<uint8_t> inputBuffer(input.begin(), input.end());

    result = this->_cipher.setInput(inputBuffer);
    if (result != NC_SUCCESS)
    {
        NOSTRCAST_LOG_NC_ERROR(result);
        return string();
    }

    if (this->_cipher.mode() == NC_UTIL_CIPHER_MODE_ENCRYPT)
    {
        NostrSecureRng::fill(this->_ivBuffer);
    }

    result = this->_cipher.update(libContext, localKey, remoteKey);
    if (result != NC_SUCCESS)
    {
        NOSTRCAST_LOG_NC_ERROR(result);
        return string();
    }

    NCResult outputSize = this->_cipher.outputSize();
    if (outputSize <= 0)
    {
        NOSTRCAST_LOG_NC_ERROR(outputSize);
        return string();
    }

    vector<uint8_t> output(outputSize);

    result = this->_cipher.readOutput(output);
    if (result != outputSize)
    {
        NOSTRCAST_LOG_NC_ERROR(result);
        return string();
    }

    return string(output.begin(), output.end());
};

string NoscryptCipher::encodeBase64(const string& str)
{
    // EVP_EncodeBlock writes four characters per three-byte group plus a terminator.
    vector<uint8_t> encoded(((str.size() + 2) / 3) * 4 + 1);

    int length = EVP_EncodeBlock(
        encoded.data(),
        reinterpret_cast<const uint8_t*>(str.data()),
        static_cast<int>(str.size())
    );

    return string(reinterpret_cast<char*>(encoded.data()), length);
};

string NoscryptCipher::decodeBase64(const string& str)
{
    if (str.empty())
    {
        return string();
    }

    vector<uint8_t> decoded((str.size() / 4 + 1) * 3);

    int length = EVP_DecodeBlock(
        decoded.data(),
        reinterpret_cast<const uint8_t*>(str.data()),
        static_cast<int>(str.size())
    );
    if (length < 0)
    {
        throw invalid_argument("NoscryptCipher::decodeBase64: Input is not valid base64.");
    }

    // EVP_DecodeBlock counts padding characters as zero bytes.
    size_t padding = 0;
    for (auto it = str.rbegin(); it != str.rend() && *it == '=' && padding < 2; ++it)
    {
        padding++;
    }

    return string(reinterpret_cast<char*>(decoded.data()), length - padding);
};

#pragma endregion
