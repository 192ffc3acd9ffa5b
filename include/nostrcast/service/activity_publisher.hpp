#pragma once

#include <future>
#include <memory>
#include <string>

#include <plog/Log.h>

#include "nostrcast/data/domain.hpp"
#include "nostrcast/service/connection_pool.hpp"
#include "nostrcast/signer/remote_signer_client.hpp"

namespace nostrcast
{
namespace service
{
/**
 * @brief Signs the user's outbound live activity with the remote signer.
 * @remark Chat messages are published through the connection pool once signed.  Zap requests
 * are returned to the caller, who sends them to the recipient's LNURL callback.
 */
class ActivityPublisher
{
public:
    ActivityPublisher(std::shared_ptr<signer::RemoteSignerClient> signer, std::shared_ptr<IConnectionPool> pool);

    /**
     * @brief Signs a chat message for a live activity and publishes it to the connected relays.
     * @param coordinate The activity's `30311:<pubkey>:<d>` coordinate, in any case.
     * @returns A future holding the published event.
     * @throws `std::invalid_argument` if the coordinate does not parse.
     * @remark The future fails with a `RemoteSignerError` if the signer does not sign the
     * message, or with a `std::runtime_error` if no relay accepts it.
     */
    std::future<std::shared_ptr<data::Event>> sendChatMessage(
        const std::string& coordinate,
        const std::string& content);

    /**
     * @brief Signs a zap request for a live activity.
     * @returns A future holding the signed kind 9734 event.
     * @throws `std::invalid_argument` if the request is incomplete.
     */
    std::future<data::Event> signZapRequest(const data::ZapRequest& request);

private:
    std::shared_ptr<signer::RemoteSignerClient> _signer;
    std::shared_ptr<IConnectionPool> _pool;
};
} // namespace service
} // namespace nostrcast
