#include <tokend/common.hpp>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <algorithm>
#include <array>

#include <blake2.h>

// Process identities for network variants
namespace
{
char const * test_process_id_data = "tokend_test_process_00000000000000000000000";

class process_constants
{
public:
	process_constants () :
	test_process_id (test_process_id_data),
	default_process_id (tokend::tokend_network == tokend::tokend_networks::tokend_test_network ? test_process_id : std::string ())
	{
	}
	std::string test_process_id;
	std::string default_process_id;
};
process_constants globals;
}

std::string const & tokend::test_process_id (globals.test_process_id);
std::string const & tokend::default_process_id (globals.default_process_id);

tokend::error_category tokend::category (tokend::process_result result_a)
{
	tokend::error_category result;
	switch (result_a)
	{
		case tokend::process_result::progress:
			result = tokend::error_category::none;
			break;
		case tokend::process_result::invalid_address:
		case tokend::process_result::invalid_quantity:
		case tokend::process_result::invalid_metadata:
		case tokend::process_result::invalid_field:
		case tokend::process_result::unknown_action:
			result = tokend::error_category::validation;
			break;
		case tokend::process_result::unauthorized:
		case tokend::process_result::unauthorized_target:
			result = tokend::error_category::authorization;
			break;
		case tokend::process_result::no_balance:
		case tokend::process_result::insufficient_balance:
			result = tokend::error_category::state;
			break;
		case tokend::process_result::already_initialized:
		case tokend::process_result::self_transfer:
		case tokend::process_result::duplicate_approval:
			result = tokend::error_category::conflict;
			break;
		case tokend::process_result::proposal_not_found:
			result = tokend::error_category::not_found;
			break;
	}
	return result;
}

std::string tokend::to_string (tokend::process_result result_a)
{
	std::string result;
	switch (result_a)
	{
		case tokend::process_result::progress:
			result = "progress";
			break;
		case tokend::process_result::invalid_address:
			result = "invalid_address";
			break;
		case tokend::process_result::invalid_quantity:
			result = "invalid_quantity";
			break;
		case tokend::process_result::invalid_metadata:
			result = "invalid_metadata";
			break;
		case tokend::process_result::invalid_field:
			result = "invalid_field";
			break;
		case tokend::process_result::unknown_action:
			result = "unknown_action";
			break;
		case tokend::process_result::unauthorized:
			result = "unauthorized";
			break;
		case tokend::process_result::unauthorized_target:
			result = "unauthorized_target";
			break;
		case tokend::process_result::no_balance:
			result = "no_balance";
			break;
		case tokend::process_result::insufficient_balance:
			result = "insufficient_balance";
			break;
		case tokend::process_result::already_initialized:
			result = "already_initialized";
			break;
		case tokend::process_result::self_transfer:
			result = "self_transfer";
			break;
		case tokend::process_result::duplicate_approval:
			result = "duplicate_approval";
			break;
		case tokend::process_result::proposal_not_found:
			result = "proposal_not_found";
			break;
	}
	return result;
}

std::string tokend::to_string (tokend::error_category category_a)
{
	std::string result;
	switch (category_a)
	{
		case tokend::error_category::none:
			result = "none";
			break;
		case tokend::error_category::validation:
			result = "ValidationError";
			break;
		case tokend::error_category::authorization:
			result = "AuthorizationError";
			break;
		case tokend::error_category::state:
			result = "StateError";
			break;
		case tokend::error_category::conflict:
			result = "ConflictError";
			break;
		case tokend::error_category::not_found:
			result = "NotFoundError";
			break;
	}
	return result;
}

std::string tokend::to_string (tokend::proposal_type type_a)
{
	return type_a == tokend::proposal_type::burn ? "burn" : "mint";
}

tokend::table tokend::token_metadata::to_table () const
{
	tokend::table result;
	result["Name"] = name;
	result["Ticker"] = ticker;
	result["Denomination"] = tokend::quantity (denomination);
	result["Logo"] = logo;
	return result;
}

void tokend::token_metadata::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("Name", name);
	tree_a.put ("Ticker", ticker);
	tree_a.put ("Denomination", std::to_string (denomination));
	tree_a.put ("Logo", logo);
}

void tokend::burn_proposal::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("id", id);
	tree_a.put ("requestor", requestor);
	tree_a.put ("quantity", tokend::encode_dec (quantity));
	boost::property_tree::ptree approvals_l;
	for (auto & i : approvals)
	{
		boost::property_tree::ptree entry;
		entry.put ("", i);
		approvals_l.push_back (std::make_pair ("", entry));
	}
	tree_a.add_child ("approvals", approvals_l);
	tree_a.put ("approved", approved);
}

tokend::type tokend::address_type (std::string const & context_a, std::string const & field_a)
{
	auto prefix (context_a + " " + field_a);
	tokend::type result;
	result.string (prefix + " must be a string.")
	.length (tokend::address_length, tokend::length_match::exact, prefix + " must be " + std::to_string (tokend::address_length) + " characters.")
	.match ("^[A-Za-z0-9_-]+$", prefix + " has invalid characters.");
	return result;
}

tokend::type tokend::quantity_type (std::string const & context_a, std::string const & field_a)
{
	auto prefix (context_a + " " + field_a);
	tokend::type result;
	result.number (prefix + " must be a number.")
	.integer (prefix + " must be an integer.")
	.greater_than (0, prefix + " must be greater than 0.");
	return result;
}

tokend::blake2_id_generator::blake2_id_generator () :
sequence (0)
{
}

std::string tokend::blake2_id_generator::generate (std::string const & requestor_a)
{
	std::array<uint8_t, 32> entropy;
	random_pool.GenerateBlock (entropy.data (), entropy.size ());
	union
	{
		uint64_t qword;
		std::array<uint8_t, 8> bytes;
	};
	qword = sequence++;
	std::array<uint8_t, 32> digest;
	blake2b_state hash;
	blake2b_init (&hash, digest.size ());
	blake2b_update (&hash, reinterpret_cast<uint8_t const *> (requestor_a.data ()), requestor_a.size ());
	blake2b_update (&hash, bytes.data (), bytes.size ());
	blake2b_update (&hash, entropy.data (), entropy.size ());
	blake2b_final (&hash, digest.data (), digest.size ());
	return tokend::encode_base64url (digest.data (), digest.size ());
}

std::string tokend::encode_base64url (uint8_t const * data_a, size_t size_a)
{
	using iterator = boost::archive::iterators::base64_from_binary<boost::archive::iterators::transform_width<uint8_t const *, 6, 8>>;
	std::string result (iterator (data_a), iterator (data_a + size_a));
	std::replace (result.begin (), result.end (), '+', '-');
	std::replace (result.begin (), result.end (), '/', '_');
	return result;
}
