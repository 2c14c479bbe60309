#include <escrow/lib/utility.hpp>

#include <pthread.h>

void escrow::thread_role::set_os_name (std::string const & thread_name)
{
	// The kernel keeps at most 15 characters plus the terminator
	auto status (pthread_setname_np (pthread_self (), thread_name.substr (0, 15).c_str ()));
	assert (status == 0);
	(void)status;
}
