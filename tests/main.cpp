#include <cstdlib>
#include <iostream>
#include <boost/test/included/unit_test.hpp>
#include <fc/log/logger.hpp>
#include <eosio/chain/exceptions.hpp>

//extended logging is opt-in with --verbose
boost::unit_test::test_suite* init_unit_test_suite(int argc, char* argv[]) {
	bool is_verbose = false;
	std::string verbose_arg = "--verbose";

	for (int i = 0; i < argc; i++) {
		if (verbose_arg == argv[i]) {
			is_verbose = true;
			break;
		}
	}

	if (is_verbose) {
		fc::logger::get(DEFAULT_LOGGER).set_log_level(fc::log_level::debug);
	} else {
		fc::logger::get(DEFAULT_LOGGER).set_log_level(fc::log_level::off);
	}

	return nullptr;
}
