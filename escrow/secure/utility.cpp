#include <escrow/lib/config.hpp>
#include <escrow/node/working.hpp>
#include <escrow/secure/utility.hpp>

#include <iostream>
#include <vector>

namespace
{
// Record store paths handed out to tests and scratch nodes
std::vector<boost::filesystem::path> scratch_paths;
}

boost::filesystem::path escrow::working_path ()
{
	static escrow::network_constants network_constants;
	return escrow::app_path () / network_constants.data_directory;
}

boost::filesystem::path escrow::unique_path ()
{
	auto result (working_path () / boost::filesystem::unique_path ());
	scratch_paths.push_back (result);
	return result;
}

void escrow::remove_temporary_directories ()
{
	for (auto const & path : scratch_paths)
	{
		// The record store is opened with MDB_NOSUBDIR, so its lock file sits beside the path
		auto lock_path (path);
		lock_path += "-lock";
		for (auto const & target : { path, lock_path })
		{
			boost::system::error_code ec;
			boost::filesystem::remove_all (target, ec);
			if (ec)
			{
				std::cerr << "Could not remove " << target.string () << ": " << ec.message () << std::endl;
			}
		}
	}
	scratch_paths.clear ();
}
