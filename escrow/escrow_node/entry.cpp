#include <escrow/escrow_node/daemon.hpp>
#include <escrow/lib/config.hpp>
#include <escrow/lib/utility.hpp>
#include <escrow/node/cli.hpp>
#include <escrow/secure/utility.hpp>

#include <boost/program_options.hpp>

#include <iostream>

int main (int argc, char * const * argv)
{
	escrow::set_umask ();
	boost::program_options::options_description description ("Command line options");
	// clang-format off
	description.add_options ()
		("help", "Print out options")
		("version", "Prints out version")
		("daemon", "Start node daemon")
		("data_path", boost::program_options::value<std::string> (), "Use the supplied path as the data directory")
		("network", boost::program_options::value<std::string> (), "Use the supplied network (live, beta or test)");
	// clang-format on
	escrow::add_node_options (description);

	boost::program_options::variables_map vm;
	try
	{
		boost::program_options::store (boost::program_options::parse_command_line (argc, argv, description), vm);
	}
	catch (boost::program_options::error const & err)
	{
		std::cerr << err.what () << std::endl;
		return 1;
	}
	boost::program_options::notify (vm);
	int result (0);

	auto network (vm.find ("network"));
	if (network != vm.end ())
	{
		if (escrow::network_constants::set_active_network (network->second.as<std::string> ()))
		{
			std::cerr << "Invalid network. Valid values are live, beta and test." << std::endl;
			return 1;
		}
	}

	auto data_path_it = vm.find ("data_path");
	boost::filesystem::path data_path ((data_path_it != vm.end ()) ? data_path_it->second.as<std::string> () : escrow::working_path ());
	if (vm.count ("daemon") > 0)
	{
		escrow_daemon::daemon daemon;
		daemon.run (data_path);
	}
	else if (vm.count ("version"))
	{
		std::cout << "Version " << ESCROW_VERSION_STRING << std::endl;
	}
	else if (vm.count ("help"))
	{
		std::cout << description << std::endl;
	}
	else
	{
		auto ec (escrow::handle_node_options (vm));
		if (ec == escrow::error_cli::unknown_command)
		{
			std::cout << description << std::endl;
		}
		result = ec ? -1 : 0;
	}
	return result;
}
