#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <noscrypt.h>
#include <noscryptutil.h>

namespace nostrcast
{
namespace cryptography
{
class NoscryptCipherContext
{
private:
    NCUtilCipherContext* _cipher;
    uint32_t _mode;

public:

    /**
     * @brief Allocates a noscryptutil cipher in the given version and mode.
     * @throws `std::runtime_error` if the cipher could not be allocated.
     * @remark The cipher zeroes its memory when freed, and is reusable so that one instance
     * may process several messages.
     */
    NoscryptCipherContext(uint32_t version, uint32_t mode);

    ~NoscryptCipherContext();

    NoscryptCipherContext(const NoscryptCipherContext&) = delete;

    NoscryptCipherContext& operator=(const NoscryptCipherContext&) = delete;

    uint32_t mode() const { return this->_mode; };

    NCResult update(
        const std::shared_ptr<const NCContext> libContext,
        const std::shared_ptr<const NCSecretKey> localKey,
        const std::shared_ptr<const NCPublicKey> remoteKey
    ) const
    {
        return NCUtilCipherUpdate(this->_cipher, libContext.get(), localKey.get(), remoteKey.get());
    };

    NCResult setIV(std::vector<uint8_t>& iv) const
    {
        return NCUtilCipherSetProperty(this->_cipher, NC_ENC_SET_IV, iv.data(), (uint32_t)iv.size());
    };

    /**
     * @brief The nonce size of the cipher, or zero if the cipher reports an error.
     */
    size_t ivSize() const;

    NCResult outputSize() const
    {
        return NCUtilCipherGetOutputSize(this->_cipher);
    };

    NCResult readOutput(std::vector<uint8_t>& output) const
    {
        return NCUtilCipherReadOutput(this->_cipher, output.data(), (uint32_t)output.size());
    };

    NCResult setInput(const std::vector<uint8_t>& input) const
    {
        return NCUtilCipherInit(this->_cipher, input.data(), input.size());
    };
};

/**
 * @brief Encrypts or decrypts NIP-44 payloads between a local secret key and a remote public key.
 */
class NoscryptCipher
{

private:
    const NoscryptCipherContext _cipher;
    /*
     * Stores the nonce for the cipher.  Noscrypt holds only a pointer to it, so this buffer
     * must stay valid for the lifetime of the cipher.
     */
    std::vector<uint8_t> _ivBuffer;

public:
    NoscryptCipher(uint32_t version, uint32_t mode);

    /**
     * @brief Performs the cipher operation on the input data. Depending on the mode
     * the cipher was initialized as, this will either encrypt or decrypt the data.
     * @param libContext The noscrypt library context.
     * @param localKey The local secret key used to encrypt/decrypt the data.
     * @param remoteKey The remote public key used to encrypt/decrypt the data.
     * @param input The data to encrypt/decrypt.
     * @returns The raw output of the operation, or an empty string if it failed.
     */
    std::string update(
        const std::shared_ptr<const NCContext> libContext,
        const std::shared_ptr<const NCSecretKey> localKey,
        const std::shared_ptr<const NCPublicKey> remoteKey,
        const std::string& input
    );

    static std::string encodeBase64(const std::string& str);

    /**
     * @throws `std::invalid_argument` if the input is not valid base64.
     */
    static std::string decodeBase64(const std::string& str);
};
} // namespace cryptography
} // namespace nostrcast
