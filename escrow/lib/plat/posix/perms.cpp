#include <escrow/lib/utility.hpp>

#include <boost/filesystem.hpp>

#include <sys/stat.h>
#include <sys/types.h>

namespace
{
// Config files hold signing keys, data directories hold the record store
auto const owner_directory (boost::filesystem::owner_all);
auto const owner_file (boost::filesystem::owner_read | boost::filesystem::owner_write);
}

void escrow::set_umask ()
{
	umask (077);
}

void escrow::set_secure_perm_directory (boost::filesystem::path const & path)
{
	boost::filesystem::permissions (path, owner_directory);
}

void escrow::set_secure_perm_directory (boost::filesystem::path const & path, boost::system::error_code & ec)
{
	boost::filesystem::permissions (path, owner_directory, ec);
}

void escrow::set_secure_perm_file (boost::filesystem::path const & path)
{
	boost::filesystem::permissions (path, owner_file);
}

void escrow::set_secure_perm_file (boost::filesystem::path const & path, boost::system::error_code & ec)
{
	boost::filesystem::permissions (path, owner_file, ec);
}
