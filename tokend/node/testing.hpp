#pragma once

#include <tokend/node/node.hpp>

namespace tokend
{
// 43 character address made of one repeated character
std::string test_address (char);
/**
 * Proposal ids "proposal_0", "proposal_1", ... so tests can address proposals directly
 */
class sequence_id_generator : public tokend::id_generator
{
public:
	sequence_id_generator ();
	std::string generate (std::string const &) override;
	uint64_t sequence;
};
/**
 * One process fed synchronously, recording every notice it emits
 */
class system
{
public:
	system (tokend::process_config const &);
	tokend::handler_result send (std::string const &, std::map<std::string, std::string> const &);
	size_t count (std::string const &, std::string const &) const;
	boost::asio::io_service service;
	tokend::process_init init;
	tokend::process process;
	std::vector<tokend::notice> notices;
	uint64_t next_id;
};
}
