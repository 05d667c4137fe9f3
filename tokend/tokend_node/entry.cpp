#include <tokend/node/node.hpp>

#include <boost/program_options.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

namespace
{
void print_line (std::mutex & mutex_a, std::string const & line_a)
{
	std::lock_guard<std::mutex> lock (mutex_a);
	std::cout << line_a << std::endl;
}

void result_json (tokend::message const & message_a, tokend::handler_result const & result_a, boost::property_tree::ptree & tree_a)
{
	tree_a.put ("Action", message_a.action ());
	tree_a.put ("Message-Id", message_a.id);
	tree_a.put ("Code", tokend::to_string (result_a.code));
	if (result_a.code != tokend::process_result::progress)
	{
		tree_a.put ("Category", tokend::to_string (tokend::category (result_a.code)));
		tree_a.put ("Error", result_a.message);
	}
	tree_a.add_child ("Output", result_a.output);
}

int run_daemon (tokend::process_config const & config_a)
{
	int result (0);
	boost::asio::io_service service;
	std::unique_ptr<boost::asio::io_service::work> work (new boost::asio::io_service::work (service));
	tokend::process_init init;
	tokend::process process (init, service, config_a);
	if (!init.error ())
	{
		std::mutex output_mutex;
		process.observers.notice.add ([&output_mutex](tokend::notice const & notice_a) {
			boost::property_tree::ptree tree;
			boost::property_tree::ptree notice_l;
			notice_a.serialize_json (notice_l);
			tree.add_child ("notice", notice_l);
			print_line (output_mutex, tokend::to_json (tree));
		});
		tokend::thread_runner runner (service, 1);
		std::string line;
		while (std::getline (std::cin, line))
		{
			if (line.empty ())
			{
				continue;
			}
			boost::property_tree::ptree tree;
			std::stringstream istream (line);
			tokend::message message;
			auto error (false);
			try
			{
				boost::property_tree::read_json (istream, tree);
			}
			catch (boost::property_tree::json_parser_error const &)
			{
				error = true;
			}
			error = error || message.deserialize_json (tree);
			if (error)
			{
				std::cerr << "Unable to parse message: " << line << std::endl;
				continue;
			}
			auto promise (std::make_shared<std::promise<tokend::handler_result>> ());
			auto future (promise->get_future ());
			process.post (message, [promise](tokend::handler_result const & result_a) {
				promise->set_value (result_a);
			});
			if (future.wait_for (tokend::dispatch_timeout) == std::future_status::ready)
			{
				boost::property_tree::ptree result_l;
				boost::property_tree::ptree entry;
				result_json (message, future.get (), entry);
				result_l.add_child ("result", entry);
				print_line (output_mutex, tokend::to_json (result_l));
			}
			else
			{
				std::cerr << "Message " << message.id << " did not complete within " << tokend::dispatch_timeout.count () << "ms" << std::endl;
			}
		}
		work.reset ();
		runner.join ();
	}
	else
	{
		std::cerr << "Unable to initialize token: " << init.ledger_init.message << std::endl;
		result = 1;
	}
	return result;
}
}

int main (int argc, char * const * argv)
{
	boost::program_options::options_description description ("Command line options");
	// clang-format off
	description.add_options ()
		("help", "Print out options")
		("data_path", boost::program_options::value<std::string> (), "Use the supplied path as the data directory")
		("daemon", "Read messages from stdin, one JSON object per line, until end of input")
		("config_dump", "Print the effective configuration");
	// clang-format on
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
	auto data_path (vm.count ("data_path") ? boost::filesystem::path (vm["data_path"].as<std::string> ()) : tokend::working_path ());
	if (vm.count ("help"))
	{
		std::cout << description << std::endl;
	}
	else
	{
		boost::system::error_code error_chmod;
		boost::filesystem::create_directories (data_path, error_chmod);
		if (error_chmod)
		{
			std::cerr << "Unable to create data path " << data_path.string () << ": " << error_chmod.message () << std::endl;
			result = 1;
		}
		else
		{
			tokend::process_config config;
			std::fstream config_file;
			auto error (tokend::fetch_object (config, data_path / "config.json", config_file));
			config_file.close ();
			if (error)
			{
				std::cerr << "Error deserializing config" << std::endl;
				result = 1;
			}
			else if (vm.count ("config_dump"))
			{
				boost::property_tree::ptree tree;
				config.serialize_json (tree);
				boost::property_tree::write_json (std::cout, tree);
			}
			else if (vm.count ("daemon"))
			{
				config.logging.init (data_path);
				result = run_daemon (config);
			}
			else
			{
				std::cout << description << std::endl;
			}
		}
	}
	return result;
}
