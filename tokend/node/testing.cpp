#include <tokend/node/testing.hpp>

#include <algorithm>

std::string tokend::test_address (char fill_a)
{
	return std::string (tokend::address_length, fill_a);
}

tokend::sequence_id_generator::sequence_id_generator () :
sequence (0)
{
}

std::string tokend::sequence_id_generator::generate (std::string const &)
{
	return "proposal_" + std::to_string (sequence++);
}

tokend::system::system (tokend::process_config const & config_a) :
process (init, service, config_a),
next_id (0)
{
	process.proposals.generator.reset (new tokend::sequence_id_generator);
	process.observers.notice.add ([this](tokend::notice const & notice_a) {
		notices.push_back (notice_a);
	});
}

tokend::handler_result tokend::system::send (std::string const & from_a, std::map<std::string, std::string> const & tags_a)
{
	tokend::message message (from_a, "message_" + std::to_string (next_id++), tags_a);
	return process.dispatch (message);
}

size_t tokend::system::count (std::string const & target_a, std::string const & action_a) const
{
	return std::count_if (notices.begin (), notices.end (), [&target_a, &action_a](tokend::notice const & notice_a) {
		return notice_a.target == target_a && notice_a.action == action_a;
	});
}
