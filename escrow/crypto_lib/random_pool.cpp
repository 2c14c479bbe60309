#include <escrow/crypto_lib/random_pool.hpp>

std::mutex escrow::random_pool::mutex;
CryptoPP::AutoSeededRandomPool escrow::random_pool::pool;

void escrow::random_pool::generate_block (unsigned char * output, size_t size)
{
	std::lock_guard<std::mutex> lk (mutex);
	pool.GenerateBlock (output, size);
}
