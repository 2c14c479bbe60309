#include <boost/filesystem.hpp>

namespace escrow_daemon
{
class daemon
{
public:
	void run (boost::filesystem::path const &);
};
}
