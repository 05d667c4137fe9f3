#include <tokend/node/utility.hpp>

#include <cstdlib>

boost::filesystem::path tokend::app_path ()
{
	boost::filesystem::path result;
	auto home (std::getenv ("HOME"));
	if (home != nullptr)
	{
		result = home;
	}
	else
	{
		result = boost::filesystem::temp_directory_path ();
	}
	return result;
}

boost::filesystem::path tokend::working_path ()
{
	auto result (tokend::app_path ());
	switch (tokend::tokend_network)
	{
		case tokend::tokend_networks::tokend_test_network:
			result /= "TokendTest";
			break;
		case tokend::tokend_networks::tokend_live_network:
			result /= "Tokend";
			break;
	}
	return result;
}

boost::filesystem::path tokend::unique_path ()
{
	auto result (working_path () / boost::filesystem::unique_path ());
	return result;
}

void tokend::open_or_create (std::fstream & stream_a, std::string const & path_a)
{
	stream_a.open (path_a, std::ios_base::in);
	if (stream_a.fail ())
	{
		stream_a.open (path_a, std::ios_base::out);
	}
	stream_a.close ();
	stream_a.open (path_a, std::ios_base::in | std::ios_base::out);
}
