#include <escrow/node/testing.hpp>

#include <gtest/gtest.h>

int main (int argc, char ** argv)
{
	escrow::force_escrow_test_network ();
	testing::InitGoogleTest (&argc, argv);
	auto result (RUN_ALL_TESTS ());
	escrow::cleanup_test_directories_on_exit ();
	return result;
}
