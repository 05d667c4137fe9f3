#include <tokend/node/testing.hpp>
#include <tokend/transfers.hpp>

#include <boost/test/unit_test.hpp>

namespace
{
class transfers_fixture
{
public:
	transfers_fixture () :
	sender (tokend::test_address ('S')),
	receiver (tokend::test_address ('R')),
	target (tokend::test_address ('P'))
	{
		ledger.init (tokend::token_metadata{ "Points", "PNT", 3, "" }, { { sender, 100 } });
		gate.add_targets ({ target });
	}
	tokend::ledger ledger;
	tokend::external_transfers gate;
	std::string sender;
	std::string receiver;
	std::string target;
};
}

BOOST_FIXTURE_TEST_SUITE (transfers, transfers_fixture)

BOOST_AUTO_TEST_CASE (targets)
{
	BOOST_CHECK (gate.authorized (target));
	BOOST_CHECK (!gate.authorized (receiver));
	gate.add_targets ({ receiver, target });
	BOOST_CHECK_EQUAL (gate.targets ().size (), 2);
	gate.remove_targets ({ target });
	BOOST_CHECK (!gate.authorized (target));
	BOOST_CHECK (gate.authorized (receiver));
}

BOOST_AUTO_TEST_CASE (debit)
{
	auto result (gate.transfer_externally (ledger, sender, receiver, target, 30));
	BOOST_REQUIRE (result.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (result.balance_old, 100);
	BOOST_CHECK_EQUAL (result.balance_new, 70);
	// The credit happens in the receiving process
	BOOST_CHECK (ledger.balances ().find (receiver) == ledger.balances ().end ());
	BOOST_CHECK_EQUAL (ledger.total_supply (), 70);
}

BOOST_AUTO_TEST_CASE (unauthorized_target)
{
	auto result (gate.transfer_externally (ledger, sender, receiver, receiver, 30));
	BOOST_CHECK (result.code == tokend::process_result::unauthorized_target);
	BOOST_CHECK (tokend::category (result.code) == tokend::error_category::authorization);
	BOOST_CHECK_EQUAL (result.message, "Process '" + receiver + "' not authorized to receive transfers");
	BOOST_CHECK_EQUAL (ledger.balances ().at (sender), 100);
}

BOOST_AUTO_TEST_CASE (authorization_checked_first)
{
	auto result (gate.transfer_externally (ledger, "bad", "bad", "unknown", 0));
	BOOST_CHECK (result.code == tokend::process_result::unauthorized_target);
}

BOOST_AUTO_TEST_CASE (invalid_inputs)
{
	auto receiver_result (gate.transfer_externally (ledger, sender, "bad", target, 30));
	BOOST_CHECK (receiver_result.code == tokend::process_result::invalid_address);
	BOOST_CHECK_EQUAL (receiver_result.message, "[Type Receiver] Cannot process external transfer. Transfer 'Receiver' address must be 43 characters.");
	auto quantity_result (gate.transfer_externally (ledger, sender, receiver, target, 0));
	BOOST_CHECK (quantity_result.code == tokend::process_result::invalid_quantity);
	BOOST_CHECK_EQUAL (quantity_result.message, "[Type Quantity] Cannot process external transfer. Transfer 'Quantity' must be greater than 0.");
	BOOST_CHECK_EQUAL (ledger.balances ().at (sender), 100);
}

BOOST_AUTO_TEST_CASE (balance_errors)
{
	auto excess (gate.transfer_externally (ledger, sender, receiver, target, 101));
	BOOST_CHECK (excess.code == tokend::process_result::insufficient_balance);
	auto missing (gate.transfer_externally (ledger, receiver, sender, target, 1));
	BOOST_CHECK (missing.code == tokend::process_result::no_balance);
	BOOST_CHECK_EQUAL (missing.message, "Cannot process external transfer. No balance for address '" + receiver + "' found.");
	BOOST_CHECK_EQUAL (ledger.balances ().at (sender), 100);
}

BOOST_AUTO_TEST_SUITE_END ()
