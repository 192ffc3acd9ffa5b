#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nostrcast
{
namespace signer
{
/**
 * @brief A NIP-46 connection descriptor.
 * @remark `bunker://<signer-pubkey>?relay=...&secret=...` is supplied by a remote signer for
 * the direct flow.  `nostrconnect://<client-pubkey>?relay=...&secret=...&name=...` is displayed
 * by the client for the reverse flow.
 */
struct ConnectionUri
{
    enum class Scheme
    {
        BUNKER,
        NOSTR_CONNECT
    };

    Scheme scheme = Scheme::BUNKER;
    std::string pubkey; ///< Lowercase hex pubkey named by the URI.
    std::vector<std::string> relays;
    std::optional<std::string> secret;
    std::map<std::string, std::string> metadata; ///< Other query parameters, such as `name` or `perms`.

    /**
     * @brief Parses a `bunker://` or `nostrconnect://` URI.
     * @throws `RemoteSignerError` with code `INVALID_URI` if the scheme is unknown, the pubkey is
     * not 32 bytes of hex, or no relay is given.
     */
    static ConnectionUri parse(const std::string& uri);

    std::string toString() const;
};
} // namespace signer
} // namespace nostrcast
