#pragma once

#include <chrono>
#include <cstddef>

namespace tokend
{
// Network variants with different default identities and logging behaviour
enum class tokend_networks
{
	// Publicly known process identity, verbose console logging
	tokend_test_network,
	// Process identity supplied by configuration, file logging only
	tokend_live_network
};
tokend::tokend_networks const tokend_network = tokend_networks::ACTIVE_NETWORK;
// Upper bound a single posted message may wait for the strand before the CLI reports it as stalled
std::chrono::milliseconds const dispatch_timeout = std::chrono::milliseconds (5000);
}
