#pragma once

#include <stdexcept>
#include <string>

namespace nostrcast
{
namespace signer
{
enum class RemoteSignerErrorCode
{
    NOT_CONNECTED,
    TIMEOUT,
    INVALID_RESPONSE,
    REMOTE_ERROR,
    CONNECTION_FAILED,
    ENCRYPTION_FAILED,
    DECRYPTION_FAILED,
    AUTHENTICATION_FAILED,
    INVALID_URI
};

/**
 * @brief A failure of a remote signer request or handshake.
 * @remark Delivered only to the caller waiting on the failed operation.
 */
class RemoteSignerError : public std::runtime_error
{
public:
    RemoteSignerError(RemoteSignerErrorCode code, const std::string& message)
    : std::runtime_error(message), _code(code) { };

    RemoteSignerErrorCode code() const { return this->_code; };

private:
    RemoteSignerErrorCode _code;
};
} // namespace signer
} // namespace nostrcast
