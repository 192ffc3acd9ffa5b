#include <stdexcept>
#include <vector>

#include "noscrypt_context.hpp"
#include "noscrypt_logger.hpp"
#include "../cryptography/nostr_secure_rng.hpp"

using namespace nostrcast::cryptography;
using namespace std;

static void _ncFreeContext(NCContext* ctx)
{
    NCDestroyContext(ctx);
    operator delete(ctx);
};

shared_ptr<NCContext> nostrcast::internal::createNoscryptContext()
{
    /* Allocates a new unmanaged block that will 
    * be freed manually with the above helper when the smart 
    * pointer is destroyed
    */
    void* ctxMemory = operator new(NCGetContextStructSize());
    auto ctx = shared_ptr<NCContext>(static_cast<NCContext*>(ctxMemory), _ncFreeContext);

    vector<uint8_t> randomEntropy(NC_CONTEXT_ENTROPY_SIZE);
    NostrSecureRng::fill(randomEntropy);

    NCResult initResult = NCInitContext(ctx.get(), randomEntropy.data());
    NostrSecureRng::zero(randomEntropy);

    if (initResult != NC_SUCCESS)
    {
        NOSTRCAST_LOG_NC_ERROR(initResult);
        throw runtime_error("Failed to initialize the noscrypt context.");
    }

    return ctx;
};
