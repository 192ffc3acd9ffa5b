#include <stdexcept>

#include <plog/Log.h>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include "nostrcast/util/encoding.hpp"
#include "nostr_secure_rng.hpp"

using namespace std;
using namespace nostrcast::cryptography;
using namespace nostrcast::util;

void NostrSecureRng::fill(void* buffer, size_t length)
{
	if (RAND_bytes(static_cast<uint8_t*>(buffer), static_cast<int>(length)) != 1)
	{
		PLOG_ERROR << "Failed to generate random bytes";
		throw runtime_error("NostrSecureRng::fill: Failed to generate random bytes.");
	}
};

void NostrSecureRng::zero(void* buffer, size_t length)
{
	OPENSSL_cleanse(buffer, length);
};

string NostrSecureRng::hexToken(size_t byteCount)
{
	vector<uint8_t> bytes(byteCount);
	fill(bytes);
	string token = toHex(bytes);
	zero(bytes);
	return token;
};
