#pragma once

#include <cryptopp/osrng.h>

#include <mutex>

namespace escrow
{
/** Thread safe wrapper around the Crypto++ auto seeded generator */
class random_pool
{
public:
	static void generate_block (unsigned char * output, size_t size);

	random_pool () = delete;
	random_pool (random_pool const &) = delete;
	random_pool & operator= (random_pool const &) = delete;

private:
	static std::mutex mutex;
	static CryptoPP::AutoSeededRandomPool pool;
};
}
