#pragma once

#include <tokend/config.hpp>

#include <boost/filesystem.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <functional>
#include <mutex>
#include <vector>

namespace tokend
{
// Directory of the current user where per application data lives
boost::filesystem::path app_path ();
// Network specific directory under app_path
boost::filesystem::path working_path ();
// Get a unique path within the working directory, used for testing
boost::filesystem::path unique_path ();
// Open a filestream for reading and writing, creating the file if it doesn't exist
void open_or_create (std::fstream &, std::string const &);
template <typename... T>
class observer_set
{
public:
	void add (std::function<void(T...)> const & observer_a)
	{
		std::lock_guard<std::mutex> lock (mutex);
		observers.push_back (observer_a);
	}
	void operator() (T... args)
	{
		std::lock_guard<std::mutex> lock (mutex);
		for (auto & i : observers)
		{
			i (args...);
		}
	}
	std::mutex mutex;
	std::vector<std::function<void(T...)>> observers;
};
/**
 * Read a JSON object from the file, an empty file yields the object's defaults
 * Writes the file back when the object reports it upgraded the tree. Returns true on error.
 */
template <typename T>
bool fetch_object (T & object_a, boost::filesystem::path const & path_a, std::fstream & stream_a)
{
	auto error (false);
	tokend::open_or_create (stream_a, path_a.string ());
	if (!stream_a.fail ())
	{
		boost::property_tree::ptree tree;
		try
		{
			boost::property_tree::read_json (stream_a, tree);
		}
		catch (boost::property_tree::json_parser_error const &)
		{
			stream_a.clear ();
			stream_a.seekg (0, std::ios_base::end);
			// Only an empty file may fail to parse
			error = stream_a.tellg () != std::streampos (0);
		}
		if (!error)
		{
			auto updated (false);
			error = object_a.deserialize_json (updated, tree);
			if (!error && updated)
			{
				stream_a.close ();
				stream_a.open (path_a.string (), std::ios_base::out | std::ios_base::trunc);
				try
				{
					boost::property_tree::write_json (stream_a, tree);
				}
				catch (boost::property_tree::json_parser_error const &)
				{
					error = true;
				}
			}
		}
	}
	else
	{
		error = true;
	}
	return error;
}
}
