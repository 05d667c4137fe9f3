#include <tokend/ledger.hpp>
#include <tokend/node/testing.hpp>

#include <boost/test/unit_test.hpp>

namespace
{
tokend::token_metadata test_metadata ()
{
	return tokend::token_metadata{ "Points", "PNT", 3, "" };
}

class ledger_fixture
{
public:
	ledger_fixture () :
	sender (tokend::test_address ('S')),
	recipient (tokend::test_address ('R'))
	{
	}
	void init (tokend::balance_map const & balances_a)
	{
		auto result (ledger.init (test_metadata (), balances_a));
		BOOST_REQUIRE (result.code == tokend::process_result::progress);
	}
	tokend::ledger ledger;
	std::string sender;
	std::string recipient;
};
}

BOOST_FIXTURE_TEST_SUITE (ledger, ledger_fixture)

BOOST_AUTO_TEST_CASE (init_once)
{
	init ({ { sender, 10 } });
	auto second (ledger.init (tokend::token_metadata{ "Other", "OTH", 6, "logo" }, { { recipient, 5 } }));
	BOOST_CHECK (second.code == tokend::process_result::already_initialized);
	BOOST_CHECK (tokend::category (second.code) == tokend::error_category::conflict);
	BOOST_CHECK_EQUAL (second.message, "Cannot initialize token. Token metadata is already defined.");
	BOOST_CHECK_EQUAL (ledger.info ().name, "Points");
	BOOST_CHECK_EQUAL (ledger.info ().denomination, 3);
	BOOST_CHECK_EQUAL (ledger.balances ().size (), 1);
	BOOST_CHECK_EQUAL (ledger.total_supply (), 10);
}

BOOST_AUTO_TEST_CASE (init_invalid_denomination)
{
	auto result (ledger.init (tokend::token_metadata{ "Points", "PNT", 0, "" }, {}));
	BOOST_CHECK (result.code == tokend::process_result::invalid_metadata);
	BOOST_CHECK_EQUAL (result.message, "[Type Denomination] Cannot create token. Field `options.globals.Denomination` must be greater than 0");
	BOOST_CHECK (!ledger.initialized);
	init ({});
	BOOST_CHECK (ledger.initialized);
}

BOOST_AUTO_TEST_CASE (init_invalid_balances)
{
	auto result (ledger.init (test_metadata (), { { "short", 1 } }));
	BOOST_CHECK (result.code == tokend::process_result::invalid_metadata);
	BOOST_CHECK_EQUAL (result.message, "Cannot create token. Field `options.globals.Balances` address must be 43 characters.");
	auto negative (ledger.init (test_metadata (), { { sender, -1 } }));
	BOOST_CHECK (negative.code == tokend::process_result::invalid_metadata);
	BOOST_CHECK_EQUAL (negative.message, "Cannot create token. Balance for address '" + sender + "' must not be negative.");
	BOOST_CHECK (ledger.balances ().empty ());
}

BOOST_AUTO_TEST_CASE (mint_then_balance)
{
	init ({});
	auto minted (ledger.mint (sender, 20));
	BOOST_REQUIRE (minted.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (minted.balance_old, 0);
	BOOST_CHECK_EQUAL (minted.balance_new, 20);
	auto balance (ledger.balance (sender));
	BOOST_REQUIRE (balance.balance);
	BOOST_CHECK_EQUAL (*balance.balance, 20);
}

BOOST_AUTO_TEST_CASE (balance_unknown)
{
	init ({});
	auto balance (ledger.balance (recipient));
	BOOST_CHECK (balance.code == tokend::process_result::progress);
	BOOST_CHECK (!balance.balance);
	auto invalid (ledger.balance ("x"));
	BOOST_CHECK (invalid.code == tokend::process_result::invalid_address);
	BOOST_CHECK_EQUAL (invalid.message, "Cannot get token balance. Target address must be 43 characters.");
}

BOOST_AUTO_TEST_CASE (transfer_partial)
{
	init ({ { sender, 190 }, { recipient, 1 } });
	auto result (ledger.transfer (sender, recipient, 1));
	BOOST_REQUIRE (result.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (result.sender_balance_old, 190);
	BOOST_CHECK_EQUAL (result.sender_balance_new, 189);
	BOOST_CHECK_EQUAL (result.recipient_balance_old, 1);
	BOOST_CHECK_EQUAL (result.recipient_balance_new, 2);
}

BOOST_AUTO_TEST_CASE (transfer_full_balance)
{
	init ({ { sender, 199 }, { recipient, 3 } });
	auto result (ledger.transfer (sender, recipient, 199));
	BOOST_REQUIRE (result.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (result.sender_balance_new, 0);
	BOOST_CHECK_EQUAL (result.recipient_balance_new, 202);
	auto existing (ledger.balances ().find (sender));
	BOOST_REQUIRE (existing != ledger.balances ().end ());
	BOOST_CHECK_EQUAL (existing->second, 0);
}

BOOST_AUTO_TEST_CASE (transfer_new_recipient)
{
	init ({ { sender, 5 } });
	auto result (ledger.transfer (sender, recipient, 2));
	BOOST_REQUIRE (result.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (result.recipient_balance_old, 0);
	BOOST_CHECK_EQUAL (ledger.balances ().at (recipient), 2);
}

BOOST_AUTO_TEST_CASE (transfer_exceeds_balance)
{
	init ({ { sender, 199 } });
	auto result (ledger.transfer (sender, recipient, 200));
	BOOST_CHECK (result.code == tokend::process_result::insufficient_balance);
	BOOST_CHECK (tokend::category (result.code) == tokend::error_category::state);
	BOOST_CHECK_EQUAL (result.message, "Cannot transfer tokens. From address '" + sender + "' has insufficient balance.");
	BOOST_CHECK_EQUAL (ledger.balances ().size (), 1);
	BOOST_CHECK_EQUAL (ledger.balances ().at (sender), 199);
}

BOOST_AUTO_TEST_CASE (transfer_no_balance)
{
	init ({});
	auto result (ledger.transfer (sender, recipient, 1));
	BOOST_CHECK (result.code == tokend::process_result::no_balance);
	BOOST_CHECK_EQUAL (result.message, "Cannot transfer tokens. No balance for From address '" + sender + "' found.");
	BOOST_CHECK (ledger.balances ().empty ());
}

BOOST_AUTO_TEST_CASE (self_transfer)
{
	init ({ { sender, 100 } });
	for (auto quantity : { 1, 100, 1000 })
	{
		auto result (ledger.transfer (sender, sender, quantity));
		BOOST_CHECK (result.code == tokend::process_result::self_transfer);
		BOOST_CHECK_EQUAL (result.message, "Cannot transfer tokens. From address cannot be the same as the Recipient address.");
	}
	BOOST_CHECK_EQUAL (ledger.balances ().at (sender), 100);
}

BOOST_AUTO_TEST_CASE (burn)
{
	init ({ { sender, 10 } });
	auto burned (ledger.burn (sender, 4));
	BOOST_REQUIRE (burned.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (burned.balance_old, 10);
	BOOST_CHECK_EQUAL (burned.balance_new, 6);
	auto excess (ledger.burn (sender, 7));
	BOOST_CHECK (excess.code == tokend::process_result::insufficient_balance);
	BOOST_CHECK_EQUAL (excess.message, "Cannot burn 7 PNT. Target address '" + sender + "' has insufficient balance: 6.");
	auto missing (ledger.burn (recipient, 1));
	BOOST_CHECK (missing.code == tokend::process_result::no_balance);
	BOOST_CHECK_EQUAL (missing.message, "Cannot burn tokens. No balance for address '" + recipient + "' found.");
	BOOST_CHECK_EQUAL (ledger.total_supply (), 6);
}

BOOST_AUTO_TEST_CASE (check_burn_leaves_state)
{
	init ({ { sender, 10 } });
	BOOST_CHECK (ledger.check_burn (sender, 10).code == tokend::process_result::progress);
	BOOST_CHECK (ledger.check_burn (sender, 11).code == tokend::process_result::insufficient_balance);
	BOOST_CHECK_EQUAL (ledger.balances ().at (sender), 10);
}

BOOST_AUTO_TEST_CASE (address_boundary)
{
	init ({ { sender, 10 } });
	std::string invalid_characters (tokend::address_length, 'A');
	invalid_characters[5] = '!';
	std::string too_long (tokend::address_length + 1, 'A');
	std::string too_short (tokend::address_length - 1, 'A');
	for (auto & address : { invalid_characters, too_long, too_short })
	{
		BOOST_CHECK (ledger.mint (address, 1).code == tokend::process_result::invalid_address);
		BOOST_CHECK (ledger.burn (address, 1).code == tokend::process_result::invalid_address);
		BOOST_CHECK (ledger.transfer (sender, address, 1).code == tokend::process_result::invalid_address);
		BOOST_CHECK (ledger.transfer (address, sender, 1).code == tokend::process_result::invalid_address);
		BOOST_CHECK (ledger.debit_external (address, 1).code == tokend::process_result::invalid_address);
		BOOST_CHECK (ledger.balance (address).code == tokend::process_result::invalid_address);
	}
	auto result (ledger.mint (invalid_characters, 1));
	BOOST_CHECK_EQUAL (result.message, "Cannot mint tokens. Target address has invalid characters.");
	BOOST_CHECK_EQUAL (ledger.total_supply (), 10);
}

BOOST_AUTO_TEST_CASE (quantity_boundary)
{
	init ({ { sender, 10 } });
	for (auto quantity : { 0, -1 })
	{
		BOOST_CHECK (ledger.mint (sender, quantity).code == tokend::process_result::invalid_quantity);
		BOOST_CHECK (ledger.burn (sender, quantity).code == tokend::process_result::invalid_quantity);
		BOOST_CHECK (ledger.transfer (sender, recipient, quantity).code == tokend::process_result::invalid_quantity);
		BOOST_CHECK (ledger.debit_external (sender, quantity).code == tokend::process_result::invalid_quantity);
	}
	BOOST_CHECK_EQUAL (ledger.mint (sender, 0).message, "Cannot mint tokens. Quantity must be greater than 0.");
	BOOST_CHECK_EQUAL (ledger.total_supply (), 10);
}

BOOST_AUTO_TEST_CASE (conservation)
{
	init ({ { sender, 1000 }, { recipient, 50 } });
	auto third (tokend::test_address ('T'));
	tokend::quantity minted (0);
	tokend::quantity burned (0);
	auto before (ledger.total_supply ());
	for (auto i (1); i <= 20; ++i)
	{
		if (ledger.mint (third, i).code == tokend::process_result::progress)
		{
			minted += i;
		}
		ledger.transfer (sender, recipient, i * 3);
		ledger.transfer (recipient, third, i * 7);
		ledger.transfer (third, sender, i * 11);
		if (ledger.burn (recipient, i * 2).code == tokend::process_result::progress)
		{
			burned += i * 2;
		}
		for (auto & entry : ledger.balances ())
		{
			BOOST_CHECK (entry.second >= 0);
		}
	}
	tokend::quantity expected (before + minted - burned);
	BOOST_CHECK_EQUAL (ledger.total_supply (), expected);
}

BOOST_AUTO_TEST_CASE (debit_external)
{
	init ({ { sender, 10 } });
	auto result (ledger.debit_external (sender, 4));
	BOOST_REQUIRE (result.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (result.balance_new, 6);
	auto excess (ledger.debit_external (sender, 7));
	BOOST_CHECK (excess.code == tokend::process_result::insufficient_balance);
	BOOST_CHECK_EQUAL (excess.message, "Cannot process external transfer. Sender address '" + sender + "' has insufficient balance.");
	BOOST_CHECK_EQUAL (ledger.total_supply (), 6);
}

BOOST_AUTO_TEST_CASE (init_oversized_denomination)
{
	auto wrapped (ledger.init (tokend::token_metadata{ "Points", "PNT", int64_t (4294967306), "" }, {}));
	BOOST_CHECK (wrapped.code == tokend::process_result::invalid_metadata);
	BOOST_CHECK_EQUAL (wrapped.message, "[Type Denomination] Cannot create token. Field `options.globals.Denomination` must be at most 255");
	auto above (ledger.init (tokend::token_metadata{ "Points", "PNT", tokend::max_denomination + 1, "" }, {}));
	BOOST_CHECK (above.code == tokend::process_result::invalid_metadata);
	BOOST_CHECK (!ledger.initialized);
	auto widest (ledger.init (tokend::token_metadata{ "Points", "PNT", tokend::max_denomination, "" }, {}));
	BOOST_CHECK (widest.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (ledger.info ().denomination, 255);
}

BOOST_AUTO_TEST_SUITE_END ()
