#include <group.service/group.service.hpp>

//======================== verification actions ========================

ACTION groupservice::setdelegate(name owner, uint64_t activity_key, uint64_t group_id, name delegate) {
	//authenticate
	require_auth(owner);

	//get config, activity, and group
	auto conf = get_config();
	get_activity(activity_key);
	auto grp = get_group(conf, activity_key, group_id);

	//validate
	check(grp.owner == owner, "only group owner can set delegate");

	//open delegates table, search for group
	delegates_table delegates(get_self(), activity_key);
	auto d_itr = delegates.find(group_id);

	//empty name revokes
	if (delegate == name()) {
		if (d_itr != delegates.end()) {
			delegates.erase(d_itr);
		}
		return;
	}

	check(is_account(delegate), "delegate account does not exist");

	if (d_itr == delegates.end()) {
		delegates.emplace(owner, [&](auto& col) {
			col.group_id = group_id;
			col.delegate = delegate;
		});
	} else if (d_itr->delegate != delegate) {
		delegates.modify(d_itr, same_payer, [&](auto& col) {
			col.delegate = delegate;
		});
	}
}

ACTION groupservice::submitscores(name submitter, uint64_t activity_key, uint64_t group_id,
	vector<name> accounts, vector<uint64_t> scores) {
	//authenticate
	require_auth(submitter);

	//get config, activity, and group
	auto conf = get_config();
	get_activity(activity_key);
	auto grp = get_group(conf, activity_key, group_id);

	//validate
	check(is_verifier(activity_key, grp, submitter), "only group owner or delegate can submit scores");
	check(grp.is_active, "group is not active");
	check(accounts.size() == scores.size(), "accounts and scores length mismatch");
	check(!accounts.empty(), "must score at least one account");

	uint64_t round = current_round(conf);
	uint64_t scope = round_scope(activity_key, round);

	//open members table, collect stakes
	members_table members(get_self(), activity_key);
	vector<uint64_t> stakes;
	uint64_t total_score = 0;

	for (size_t i = 0; i < accounts.size(); i++) {
		auto m_itr = members.find(accounts[i].value);

		check(m_itr != members.end() && m_itr->group_id == group_id, "account is not a member of this group");
		check(scores[i] <= conf.max_origin_score, "score exceeds max origin score");

		for (size_t j = 0; j < i; j++) {
			check(accounts[j] != accounts[i], "duplicate account");
		}

		stakes.push_back(uint64_t(m_itr->amount));
		total_score += scores[i];
	}

	//a new submission replaces the group's scores for this round
	originscores_table originscores(get_self(), scope);
	auto by_group = originscores.get_index<"bygroup"_n>();
	auto os_itr = by_group.lower_bound(uint128_t(group_id) << 64);

	while (os_itr != by_group.end() && os_itr->group_id == group_id) {
		os_itr = by_group.erase(os_itr);
	}

	for (size_t i = 0; i < accounts.size(); i++) {
		originscores.emplace(submitter, [&](auto& col) {
			col.id = originscores.available_primary_key();
			col.account = accounts[i];
			col.group_id = group_id;
			col.score = scores[i];
			col.amount = int64_t(stakes[i]);
		});
	}

	uint64_t verified = groupmath::verified_amount(stakes, scores, conf.max_origin_score);

	//open verifications table, search for group
	verifications_table verifications(get_self(), scope);
	auto v_itr = verifications.find(group_id);

	if (v_itr == verifications.end()) {
		verifications.emplace(submitter, [&](auto& col) {
			col.group_id = group_id;
			col.owner = grp.owner;
			col.submitter = submitter;
			col.total_score = total_score;
			col.verified_amount = verified;
		});
	} else {
		verifications.modify(v_itr, same_payer, [&](auto& col) {
			col.owner = grp.owner;
			col.submitter = submitter;
			col.total_score = total_score;
			col.verified_amount = verified;
		});
	}

	print("\ngroup ", group_id, " verified ", verified, " in round ", round);
}

//========== utility methods ==========

bool groupservice::is_verifier(uint64_t activity_key, const group_info& grp, name account) {
	if (account == grp.owner) {
		return true;
	}

	delegates_table delegates(get_self(), activity_key);
	auto d_itr = delegates.find(grp.group_id);

	return d_itr != delegates.end() && d_itr->delegate == account;
}
