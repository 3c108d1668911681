/**
 * Table definitions owned by the contracts the group service depends on. The
 * group service only reads these; the layouts must match the owning contracts.
 */

#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

using namespace std;
using namespace eosio;

static constexpr uint64_t MAX_SCOPED_ROUND = 0xFFFFFFFF;

//scope of per-round rows, shared with the governance contract's quotas
inline uint64_t round_scope(uint64_t activity_key, uint64_t round) {
	check(round <= MAX_SCOPED_ROUND, "round out of range");
	return (activity_key << 32) | round;
}

//======================== lifecycle tables ========================

//scope: activity_key
struct group_info {
	uint64_t group_id;
	name owner;
	bool is_active;
	int64_t min_join; //NOTE: in the activity asset's smallest unit
	int64_t max_join; //NOTE: 0 means unbounded
	uint32_t max_accounts; //NOTE: 0 means unbounded

	uint64_t primary_key() const { return group_id; }
	uint128_t by_owner() const { return (uint128_t(owner.value) << 64) | group_id; }
	EOSLIB_SERIALIZE(group_info, (group_id)(owner)(is_active)(min_join)(max_join)(max_accounts))
};
typedef multi_index<name("groups"), group_info,
	indexed_by<name("byowner"), const_mem_fun<group_info, uint128_t, &group_info::by_owner>>> ext_groups_table;

//======================== roster tables ========================

//scope: activity_key
struct roster_entry {
	name account;
	uint32_t join_round;
	bool exited;
	uint32_t exit_round;

	uint64_t primary_key() const { return account.value; }
	EOSLIB_SERIALIZE(roster_entry, (account)(join_round)(exited)(exit_round))
};
typedef multi_index<name("roster"), roster_entry> ext_roster_table;

//======================== governance tables ========================

//scope: round_scope(activity_key, round)
struct verifier_quota {
	name voter;
	uint64_t quota;

	uint64_t primary_key() const { return voter.value; }
	EOSLIB_SERIALIZE(verifier_quota, (voter)(quota))
};
typedef multi_index<name("quotas"), verifier_quota> ext_quotas_table;

//scope: activity_key
struct round_votes {
	uint64_t round;
	uint64_t total_votes;

	uint64_t primary_key() const { return round; }
	EOSLIB_SERIALIZE(round_votes, (round)(total_votes))
};
typedef multi_index<name("totalvotes"), round_votes> ext_totalvotes_table;

//======================== reward pool tables ========================

//scope: activity_key
struct pool_reward {
	uint64_t round;
	int64_t amount; //NOTE: in the configured reward symbol

	uint64_t primary_key() const { return round; }
	EOSLIB_SERIALIZE(pool_reward, (round)(amount))
};
typedef multi_index<name("poolrewards"), pool_reward> ext_poolrewards_table;
