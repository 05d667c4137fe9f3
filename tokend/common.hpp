#pragma once

#include <tokend/config.hpp>
#include <tokend/lib/numbers.hpp>
#include <tokend/lib/validation.hpp>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include <map>
#include <string>
#include <vector>

#include <cryptopp/osrng.h>

namespace tokend
{
// Address -> raw balance, ordered by address
using balance_map = std::map<std::string, tokend::quantity>;
size_t constexpr address_length = 43;
enum class process_result
{
	progress, // Operation applied
	invalid_address, // Address is not a 43 character [A-Za-z0-9_-] string
	invalid_quantity, // Quantity is not a positive integer
	invalid_metadata, // Token metadata or initial balances malformed
	invalid_field, // Some other inbound field failed its check
	unknown_action, // No handler registered for the action
	unauthorized, // Address is not a member of the required set
	unauthorized_target, // Process is not an authorized external target
	no_balance, // Address has no recorded balance
	insufficient_balance, // Recorded balance is below the requested quantity
	already_initialized, // Token metadata is already set
	self_transfer, // Sender and recipient are the same address
	duplicate_approval, // Approver already approved this proposal
	proposal_not_found // No proposal with this requestor and id
};
enum class error_category
{
	none,
	validation,
	authorization,
	state,
	conflict,
	not_found
};
tokend::error_category category (tokend::process_result);
std::string to_string (tokend::process_result);
std::string to_string (tokend::error_category);
class process_return
{
public:
	tokend::process_result code;
	std::string message;
};
class change_return
{
public:
	tokend::process_result code;
	std::string message;
	tokend::quantity balance_old;
	tokend::quantity balance_new;
};
class transfer_return
{
public:
	tokend::process_result code;
	std::string message;
	tokend::quantity sender_balance_old;
	tokend::quantity sender_balance_new;
	tokend::quantity recipient_balance_old;
	tokend::quantity recipient_balance_new;
};
class balance_return
{
public:
	tokend::process_result code;
	std::string message;
	// Absent when the address has never held a balance
	boost::optional<tokend::quantity> balance;
};
/**
 * Token metadata, immutable once the ledger is initialized
 */
class token_metadata
{
public:
	tokend::table to_table () const;
	void serialize_json (boost::property_tree::ptree &) const;
	std::string name;
	std::string ticker;
	int64_t denomination;
	std::string logo;
};
enum class proposal_type
{
	burn,
	mint
};
std::string to_string (tokend::proposal_type);
class burn_proposal
{
public:
	void serialize_json (boost::property_tree::ptree &) const;
	std::string id;
	std::string requestor;
	tokend::quantity quantity;
	// Approver addresses in arrival order
	std::vector<std::string> approvals;
	bool approved;
};
class proposal_return
{
public:
	tokend::process_result code;
	std::string message;
	tokend::burn_proposal proposal;
};
class approval_return
{
public:
	tokend::process_result code;
	std::string message;
	tokend::burn_proposal proposal;
	// True only for the approval that moved the proposal to approved
	bool transitioned;
};
// String of exactly 43 characters from [A-Za-z0-9_-]
tokend::type address_type (std::string const &, std::string const &);
// Integral number strictly greater than zero
tokend::type quantity_type (std::string const &, std::string const &);
/**
 * Source of proposal identifiers
 */
class id_generator
{
public:
	virtual ~id_generator () = default;
	virtual std::string generate (std::string const &) = 0;
};
/**
 * BLAKE2b-256 over the requestor, a sequence number and random pool bytes, base64url encoded without padding
 */
class blake2_id_generator : public tokend::id_generator
{
public:
	blake2_id_generator ();
	std::string generate (std::string const &) override;
	uint64_t sequence;
	CryptoPP::AutoSeededRandomPool random_pool;
};
std::string encode_base64url (uint8_t const *, size_t);
extern std::string const & test_process_id;
// Identity used when the configuration names none, empty on the live network
extern std::string const & default_process_id;
}
