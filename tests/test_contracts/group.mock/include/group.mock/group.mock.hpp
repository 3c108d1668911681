/**
 * Stand-in for the contracts the group service reads from: group lifecycle,
 * roster, governance quotas and totals, the per-round reward pool, and a
 * minimal token with transfer notifications.
 */

#pragma once

#include <group.service/external.tables.hpp>

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

using namespace eosio;
using namespace std;

class [[eosio::contract("group.mock")]] groupmock : public contract {

	public:

	using contract::contract;

	//======================== lifecycle actions ========================

	ACTION setgroup(uint64_t activity_key, uint64_t group_id, name owner, bool is_active,
		int64_t min_join, int64_t max_join, uint32_t max_accounts);

	//======================== roster actions ========================

	ACTION setroster(uint64_t activity_key, name account, uint32_t join_round, bool exited, uint32_t exit_round);

	//======================== governance actions ========================

	ACTION setquota(uint64_t activity_key, uint64_t round, name voter, uint64_t quota);

	ACTION settotal(uint64_t activity_key, uint64_t round, uint64_t total_votes);

	//======================== pool actions ========================

	ACTION setpool(uint64_t activity_key, uint64_t round, int64_t amount);

	//======================== token actions ========================

	ACTION issue(name to, asset quantity);

	ACTION transfer(name from, name to, asset quantity, string memo);

	//scope: owner.value
	TABLE account {
		asset balance;

		uint64_t primary_key() const { return balance.symbol.code().raw(); }
		EOSLIB_SERIALIZE(account, (balance))
	};
	typedef multi_index<name("accounts"), account> accounts_table;

	//========== utility methods ==========

	void add_balance(name owner, asset quantity);

	void sub_balance(name owner, asset quantity);

};
