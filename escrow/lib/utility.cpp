#include <escrow/lib/utility.hpp>

#include <iostream>

namespace
{
thread_local escrow::thread_role::name current_thread_role (escrow::thread_role::name::unknown);
}

escrow::thread_role::name escrow::thread_role::get ()
{
	return current_thread_role;
}

/*
 * Names are shown by debuggers and top, Linux truncates them at 15 characters
 */
std::string escrow::thread_role::get_string (escrow::thread_role::name role)
{
	std::string result;
	switch (role)
	{
		case escrow::thread_role::name::unknown:
			result = "<unknown>";
			break;
		case escrow::thread_role::name::io:
			result = "I/O";
			break;
		case escrow::thread_role::name::reconciler:
			result = "Reconciler";
			break;
		case escrow::thread_role::name::block_production:
			result = "Block producer";
			break;
	}
	assert (result.size () < 16);
	return result;
}

std::string escrow::thread_role::get_string ()
{
	return get_string (current_thread_role);
}

void escrow::thread_role::set (escrow::thread_role::name role)
{
	escrow::thread_role::set_os_name (get_string (role));
	current_thread_role = role;
}

uint64_t escrow::seconds_since_epoch ()
{
	return std::chrono::duration_cast<std::chrono::seconds> (std::chrono::system_clock::now ().time_since_epoch ()).count ();
}

/*
 * Backing code for "release_assert", which is itself a macro
 */
void release_assert_internal (bool check, const char * check_expr, const char * file, unsigned int line)
{
	if (!check)
	{
		std::cerr << "Assertion (" << check_expr << ") failed " << file << ":" << line << std::endl;
		abort ();
	}
}
