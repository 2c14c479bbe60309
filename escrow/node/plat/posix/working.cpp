#include <escrow/node/working.hpp>

#include <cassert>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace escrow
{
boost::filesystem::path app_path ()
{
	auto entry (getpwuid (getuid ()));
	assert (entry != nullptr);
	boost::filesystem::path result (entry->pw_dir);
	return result;
}
}
