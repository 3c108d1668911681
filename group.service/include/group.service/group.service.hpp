/**
 * Group Service Contract Interface
 *
 * Accounts stake into groups of an activity, group owners (or a delegate) score
 * their members every round, verifiers cast distrust votes against owners, and
 * the service reward of each finished round is shared among owners by their
 * trust-adjusted verified stake, then split to the recipients each owner chose.
 */

#pragma once

#include <group.service/group.math.hpp>
#include <group.service/external.tables.hpp>

#include <eosio/eosio.hpp>
#include <eosio/action.hpp>
#include <eosio/asset.hpp>
#include <eosio/fixed_bytes.hpp>
#include <eosio/singleton.hpp>
#include <eosio/symbol.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <map>
#include <string>
#include <vector>

using namespace eosio;
using namespace std;

class [[eosio::contract("group.service")]] groupservice : public contract {

	public:

	groupservice(name self, name code, datastream<const char*> ds);

	~groupservice();

	//constants
	static constexpr uint64_t PRECISION = groupmath::PRECISION;
	static constexpr uint64_t MAX_ACTIVITY_KEY = 0xFFFFFFFF;
	const uint16_t DEFAULT_MAX_RECIPIENTS = 10;
	const uint64_t DEFAULT_MAX_ORIGIN_SCORE = 100;
	const string POOL_MEMO_PREFIX = "pool:";

	//======================== admin actions ========================

	//sets collaborators and limits, first call stamps the round origin
	ACTION setconfig(name admin, name token_contract, symbol reward_symbol,
		name lifecycle, name roster, name governance, name pool, name burn_account,
		uint32_t round_length, uint16_t max_recipients, uint64_t max_origin_score);

	//registers an (asset, action id) activity and assigns its key
	ACTION addactivity(symbol asset_sym, uint32_t action_id);

	//======================== custody actions ========================

	//withdraws a deposit balance back to the token contract
	ACTION withdraw(name owner, asset quantity);

	//======================== membership actions ========================

	//stakes quantity from deposit into a group, adding to an existing stake in the same group
	ACTION joingroup(name account, uint64_t activity_key, uint64_t group_id, asset quantity);

	//leaves the account's group in the activity, stake returns to deposit
	ACTION exitgroup(name account, uint64_t activity_key);

	//======================== verification actions ========================

	//replaces the group's delegate, an empty name revokes it
	ACTION setdelegate(name owner, uint64_t activity_key, uint64_t group_id, name delegate);

	//overwrites the group's origin scores for the current round
	ACTION submitscores(name submitter, uint64_t activity_key, uint64_t group_id,
		vector<name> accounts, vector<uint64_t> scores);

	//======================== distrust actions ========================

	ACTION distrustvote(name voter, uint64_t activity_key, name target, uint64_t amount, string reason);

	//======================== reward actions ========================

	//sets the group's recipient split for the current round
	ACTION setrecips(name owner, uint64_t activity_key, uint64_t group_id,
		vector<name> recipients, vector<uint64_t> ratios);

	//materializes rewards for a finished round, no-op once settled
	ACTION settle(uint64_t activity_key, uint64_t round);

	ACTION claimreward(name account, uint64_t activity_key, uint64_t round);

	//burns the part of a finished round's service reward that no owner earned
	ACTION burnreward(uint64_t activity_key, uint64_t round);

	//========== notification methods ==========

	[[eosio::on_notify("*::transfer")]]
	void catch_transfer(name from, name to, asset quantity, string memo);

	//======================== config tables ========================

	//scope: singleton
	TABLE config {
		name admin;
		name token_contract;
		symbol reward_symbol;
		name lifecycle;
		name roster;
		name governance;
		name pool;
		name burn_account;
		time_point_sec round_origin;
		uint32_t round_length;
		uint16_t max_recipients;
		uint64_t max_origin_score;

		EOSLIB_SERIALIZE(config, (admin)(token_contract)(reward_symbol)
			(lifecycle)(roster)(governance)(pool)(burn_account)
			(round_origin)(round_length)(max_recipients)(max_origin_score))
	};
	typedef singleton<name("config"), config> config_singleton;

	//scope: get_self().value
	TABLE activity {
		uint64_t activity_key;
		symbol asset_sym;
		uint32_t action_id;

		uint64_t primary_key() const { return activity_key; }
		uint64_t by_asset() const { return asset_sym.code().raw(); }
		uint128_t by_action() const { return (uint128_t(asset_sym.code().raw()) << 64) | action_id; }
		EOSLIB_SERIALIZE(activity, (activity_key)(asset_sym)(action_id))
	};
	typedef multi_index<name("activities"), activity,
		indexed_by<name("byasset"), const_mem_fun<activity, uint64_t, &activity::by_asset>>,
		indexed_by<name("byaction"), const_mem_fun<activity, uint128_t, &activity::by_action>>> activities_table;

	//scope: get_self().value
	//NOTE: funded by transfers with memo "pool:<activity_key>", drawn by claims and burns
	TABLE poolbalance {
		uint64_t activity_key;
		asset balance;

		uint64_t primary_key() const { return activity_key; }
		EOSLIB_SERIALIZE(poolbalance, (activity_key)(balance))
	};
	typedef multi_index<name("pools"), poolbalance> pools_table;

	//scope: owner.value
	TABLE deposit {
		asset balance;

		uint64_t primary_key() const { return balance.symbol.code().raw(); }
		EOSLIB_SERIALIZE(deposit, (balance))
	};
	typedef multi_index<name("deposits"), deposit> deposits_table;

	//======================== membership tables ========================

	//scope: activity_key
	TABLE member {
		name account;
		uint64_t group_id;
		int64_t amount;
		uint64_t join_round;

		uint64_t primary_key() const { return account.value; }
		uint128_t by_group() const { return (uint128_t(group_id) << 64) | account.value; }
		EOSLIB_SERIALIZE(member, (account)(group_id)(amount)(join_round))
	};
	typedef multi_index<name("members"), member,
		indexed_by<name("bygroup"), const_mem_fun<member, uint128_t, &member::by_group>>> members_table;

	//NOTE: the counts below are cardinalities of the child sets, rows are erased when they reach zero

	//scope: activity_key
	TABLE groupstat {
		uint64_t group_id;
		name owner;
		uint32_t accounts;
		int64_t total_amount;

		uint64_t primary_key() const { return group_id; }
		uint128_t by_owner() const { return (uint128_t(owner.value) << 64) | group_id; }
		EOSLIB_SERIALIZE(groupstat, (group_id)(owner)(accounts)(total_amount))
	};
	typedef multi_index<name("groupstats"), groupstat,
		indexed_by<name("byowner"), const_mem_fun<groupstat, uint128_t, &groupstat::by_owner>>> groupstats_table;

	//scope: activity_key
	TABLE ownerstat {
		name owner;
		uint32_t groups;
		uint32_t accounts;
		int64_t total_amount;

		uint64_t primary_key() const { return owner.value; }
		EOSLIB_SERIALIZE(ownerstat, (owner)(groups)(accounts)(total_amount))
	};
	typedef multi_index<name("ownerstats"), ownerstat> ownerstats_table;

	//scope: asset code
	TABLE actstat {
		uint64_t activity_key;
		uint32_t accounts;
		int64_t total_amount;

		uint64_t primary_key() const { return activity_key; }
		EOSLIB_SERIALIZE(actstat, (activity_key)(accounts)(total_amount))
	};
	typedef multi_index<name("actstats"), actstat> actstats_table;

	//scope: asset code
	TABLE assetacct {
		name account;
		uint32_t activities;
		int64_t total_amount;

		uint64_t primary_key() const { return account.value; }
		EOSLIB_SERIALIZE(assetacct, (account)(activities)(total_amount))
	};
	typedef multi_index<name("assetaccts"), assetacct> assetaccts_table;

	//scope: account.value
	TABLE acctasset {
		symbol_code asset_code;
		uint32_t activities;

		uint64_t primary_key() const { return asset_code.raw(); }
		EOSLIB_SERIALIZE(acctasset, (asset_code)(activities))
	};
	typedef multi_index<name("acctassets"), acctasset> acctassets_table;

	//scope: account.value
	TABLE acctact {
		uint64_t activity_key;
		symbol_code asset_code;
		uint64_t group_id;
		int64_t amount;

		uint64_t primary_key() const { return activity_key; }
		uint128_t by_asset() const { return (uint128_t(asset_code.raw()) << 64) | activity_key; }
		EOSLIB_SERIALIZE(acctact, (activity_key)(asset_code)(group_id)(amount))
	};
	typedef multi_index<name("acctacts"), acctact,
		indexed_by<name("byasset"), const_mem_fun<acctact, uint128_t, &acctact::by_asset>>> acctacts_table;

	//======================== verification tables ========================

	//scope: activity_key
	TABLE delegation {
		uint64_t group_id;
		name delegate;

		uint64_t primary_key() const { return group_id; }
		EOSLIB_SERIALIZE(delegation, (group_id)(delegate))
	};
	typedef multi_index<name("delegates"), delegation> delegates_table;

	//scope: round_scope(activity_key, round)
	TABLE verification {
		uint64_t group_id;
		name owner;
		name submitter;
		uint64_t total_score;
		uint64_t verified_amount;

		uint64_t primary_key() const { return group_id; }
		uint128_t by_owner() const { return (uint128_t(owner.value) << 64) | group_id; }
		EOSLIB_SERIALIZE(verification, (group_id)(owner)(submitter)(total_score)(verified_amount))
	};
	typedef multi_index<name("verified"), verification,
		indexed_by<name("byowner"), const_mem_fun<verification, uint128_t, &verification::by_owner>>> verifications_table;

	//scope: round_scope(activity_key, round)
	TABLE originscore {
		uint64_t id;
		name account;
		uint64_t group_id;
		uint64_t score;
		int64_t amount; //NOTE: stake at submission time

		uint64_t primary_key() const { return id; }
		uint128_t by_group() const { return (uint128_t(group_id) << 64) | account.value; }
		EOSLIB_SERIALIZE(originscore, (id)(account)(group_id)(score)(amount))
	};
	typedef multi_index<name("originscores"), originscore,
		indexed_by<name("bygroup"), const_mem_fun<originscore, uint128_t, &originscore::by_group>>> originscores_table;

	//======================== distrust tables ========================

	//scope: round_scope(activity_key, round)
	TABLE voterusage {
		name voter;
		uint64_t used;

		uint64_t primary_key() const { return voter.value; }
		EOSLIB_SERIALIZE(voterusage, (voter)(used))
	};
	typedef multi_index<name("voterusage"), voterusage> voterusage_table;

	//scope: round_scope(activity_key, round)
	TABLE distrust {
		name target;
		uint64_t amount;

		uint64_t primary_key() const { return target.value; }
		EOSLIB_SERIALIZE(distrust, (target)(amount))
	};
	typedef multi_index<name("distrusts"), distrust> distrusts_table;

	//scope: round_scope(activity_key, round)
	TABLE votereceipt {
		uint64_t id;
		name voter;
		name target;
		uint64_t amount;
		string reason; //NOTE: most recent reason only

		uint64_t primary_key() const { return id; }
		uint128_t by_voter_target() const { return (uint128_t(voter.value) << 64) | target.value; }
		EOSLIB_SERIALIZE(votereceipt, (id)(voter)(target)(amount)(reason))
	};
	typedef multi_index<name("distvotes"), votereceipt,
		indexed_by<name("byvotertgt"), const_mem_fun<votereceipt, uint128_t, &votereceipt::by_voter_target>>> votereceipts_table;

	//======================== reward tables ========================

	//scope: activity_key
	//NOTE: append-only history, the split in effect at round R is the latest row at or before R
	TABLE recipient_split {
		uint64_t id;
		name owner;
		uint64_t group_id;
		uint64_t round;
		vector<name> recipients;
		vector<uint64_t> ratios;

		uint64_t primary_key() const { return id; }
		checksum256 by_key() const { return split_key(owner, group_id, round); }
		EOSLIB_SERIALIZE(recipient_split, (id)(owner)(group_id)(round)(recipients)(ratios))
	};
	typedef multi_index<name("recipients"), recipient_split,
		indexed_by<name("bykey"), const_mem_fun<recipient_split, checksum256, &recipient_split::by_key>>> recipients_table;

	//scope: activity_key
	TABLE roundstat {
		uint64_t round;
		int64_t service_reward;
		uint64_t total_generated;
		int64_t total_reward;
		uint32_t verified_groups;

		uint64_t primary_key() const { return round; }
		EOSLIB_SERIALIZE(roundstat, (round)(service_reward)(total_generated)(total_reward)(verified_groups))
	};
	typedef multi_index<name("roundstats"), roundstat> roundstats_table;

	//scope: round_scope(activity_key, round)
	TABLE groupresult {
		uint64_t group_id;
		name owner;
		uint64_t verified_amount;
		uint64_t distrust_amount;
		uint64_t total_votes;
		uint64_t distrust_rate;
		uint64_t distrust_reduction;
		uint64_t generated;
		int64_t reward;
		vector<name> recipients;
		vector<int64_t> recipient_amounts;
		int64_t owner_amount;

		uint64_t primary_key() const { return group_id; }
		uint128_t by_owner() const { return (uint128_t(owner.value) << 64) | group_id; }
		EOSLIB_SERIALIZE(groupresult, (group_id)(owner)
			(verified_amount)(distrust_amount)(total_votes)(distrust_rate)(distrust_reduction)(generated)
			(reward)(recipients)(recipient_amounts)(owner_amount))
	};
	typedef multi_index<name("groupresults"), groupresult,
		indexed_by<name("byowner"), const_mem_fun<groupresult, uint128_t, &groupresult::by_owner>>> groupresults_table;

	//scope: round_scope(activity_key, round)
	TABLE reward {
		name account;
		uint64_t generated;
		int64_t amount;
		bool eligible;
		bool claimed;

		uint64_t primary_key() const { return account.value; }
		EOSLIB_SERIALIZE(reward, (account)(generated)(amount)(eligible)(claimed))
	};
	typedef multi_index<name("rewards"), reward> rewards_table;

	//scope: activity_key
	TABLE burn {
		uint64_t round;
		int64_t amount;
		bool burned;

		uint64_t primary_key() const { return round; }
		EOSLIB_SERIALIZE(burn, (round)(amount)(burned))
	};
	typedef multi_index<name("burns"), burn> burns_table;

	//========== utility methods ==========

	static checksum256 split_key(name owner, uint64_t group_id, uint64_t round) {
		return checksum256::make_from_word_sequence<uint64_t>(owner.value, group_id, round, uint64_t(0));
	}

	config get_config();

	uint64_t current_round(const config& conf);

	activity get_activity(uint64_t activity_key);

	group_info get_group(const config& conf, uint64_t activity_key, uint64_t group_id);

	void credit_deposit(name owner, asset quantity);

	void debit_deposit(name owner, asset quantity);

	void credit_pool(uint64_t activity_key, asset quantity);

	void debit_pool(const config& conf, uint64_t activity_key, int64_t amount);

	void send_reward(const config& conf, name to, int64_t amount, string memo);

	//collaborator reads, missing rows read as zero
	uint64_t get_verifier_quota(const config& conf, uint64_t activity_key, uint64_t round, name voter);
	uint64_t get_total_votes(const config& conf, uint64_t activity_key, uint64_t round);
	int64_t get_service_reward(const config& conf, uint64_t activity_key, uint64_t round);
	bool is_reward_minted(const config& conf, uint64_t activity_key, uint64_t round);
	bool is_on_roster(const config& conf, uint64_t activity_key, name account, uint64_t round);

	void index_join(const activity& act, name account, uint64_t group_id, name owner, int64_t amount, bool is_new);

	void index_exit(const activity& act, const member& mem);

	bool is_verifier(uint64_t activity_key, const group_info& grp, name account);

	bool owns_active_group(const config& conf, uint64_t activity_key, name owner);

	bool recipients_at(uint64_t activity_key, name owner, uint64_t group_id, uint64_t round,
		vector<name>& recipients, vector<uint64_t>& ratios);

	roundstat settle_round(const config& conf, uint64_t activity_key, uint64_t round);

	void allocate_group_rewards(groupresults_table& groupresults, uint64_t activity_key, uint64_t round,
		name owner, uint64_t amount);

};
