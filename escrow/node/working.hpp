#pragma once

#include <boost/filesystem.hpp>

namespace escrow
{
boost::filesystem::path app_path ();
}
