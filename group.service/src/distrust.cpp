#include <group.service/group.service.hpp>

//======================== distrust actions ========================

ACTION groupservice::distrustvote(name voter, uint64_t activity_key, name target, uint64_t amount, string reason) {
	//authenticate
	require_auth(voter);

	//get config and activity
	auto conf = get_config();
	get_activity(activity_key);

	//validate
	check(amount > 0, "distrust amount must be greater than zero");
	check(!reason.empty(), "reason cannot be empty");
	check(reason.size() <= 256, "reason has more than 256 bytes");

	uint64_t round = current_round(conf);
	uint64_t scope = round_scope(activity_key, round);
	uint64_t quota = get_verifier_quota(conf, activity_key, round, voter);

	check(quota > 0, "voter has no verify votes this round");

	//open voterusage table, search for voter
	voterusage_table usage(get_self(), scope);
	auto u_itr = usage.find(voter.value);
	uint64_t used = u_itr == usage.end() ? 0 : u_itr->used;

	check(amount <= quota && used <= quota - amount, "distrust votes exceed verify votes");
	check(owns_active_group(conf, activity_key, target), "target owns no active groups");

	if (u_itr == usage.end()) {
		usage.emplace(voter, [&](auto& col) {
			col.voter = voter;
			col.used = amount;
		});
	} else {
		usage.modify(u_itr, same_payer, [&](auto& col) {
			col.used += amount;
		});
	}

	//open distrusts table, search for target
	distrusts_table distrusts(get_self(), scope);
	auto d_itr = distrusts.find(target.value);

	if (d_itr == distrusts.end()) {
		distrusts.emplace(voter, [&](auto& col) {
			col.target = target;
			col.amount = amount;
		});
	} else {
		distrusts.modify(d_itr, same_payer, [&](auto& col) {
			col.amount += amount;
		});
	}

	//open receipts table, search by voter and target
	votereceipts_table receipts(get_self(), scope);
	auto by_voter_target = receipts.get_index<"byvotertgt"_n>();
	auto r_itr = by_voter_target.find((uint128_t(voter.value) << 64) | target.value);

	if (r_itr == by_voter_target.end()) {
		receipts.emplace(voter, [&](auto& col) {
			col.id = receipts.available_primary_key();
			col.voter = voter;
			col.target = target;
			col.amount = amount;
			col.reason = reason;
		});
	} else {
		by_voter_target.modify(r_itr, same_payer, [&](auto& col) {
			col.amount += amount;
			col.reason = reason;
		});
	}

	print("\n", voter, " cast ", amount, " distrust against ", target);
}

//========== utility methods ==========

bool groupservice::owns_active_group(const config& conf, uint64_t activity_key, name owner) {
	ext_groups_table groups(conf.lifecycle, activity_key);
	auto by_owner = groups.get_index<"byowner"_n>();

	for (auto g_itr = by_owner.lower_bound(uint128_t(owner.value) << 64);
		g_itr != by_owner.end() && g_itr->owner == owner; g_itr++) {
		if (g_itr->is_active) {
			return true;
		}
	}

	return false;
}
