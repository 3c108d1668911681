#include <group.service/group.service.hpp>

//======================== reward actions ========================

ACTION groupservice::setrecips(name owner, uint64_t activity_key, uint64_t group_id,
	vector<name> recipients, vector<uint64_t> ratios) {
	//authenticate
	require_auth(owner);

	//get config, activity, and group
	auto conf = get_config();
	get_activity(activity_key);
	auto grp = get_group(conf, activity_key, group_id);

	//validate
	check(grp.owner == owner, "only group owner can set recipients");
	check(recipients.size() == ratios.size(), "recipients and ratios length mismatch");
	check(recipients.size() <= conf.max_recipients, "too many recipients");

	uint64_t total_ratio = 0;

	for (size_t i = 0; i < recipients.size(); i++) {
		check(recipients[i] != name(), "recipient cannot be empty");
		check(is_account(recipients[i]), "recipient account does not exist");
		check(ratios[i] > 0, "ratio must be greater than zero");
		check(ratios[i] <= PRECISION - total_ratio, "ratios exceed one full unit");
		check(recipients[i] != owner, "recipient cannot be the group owner");

		for (size_t j = 0; j < i; j++) {
			check(recipients[j] != recipients[i], "duplicate recipient");
		}

		total_ratio += ratios[i];
	}

	uint64_t round = current_round(conf);

	//open recipients table, search for this round's split
	recipients_table splits(get_self(), activity_key);
	auto by_key = splits.get_index<"bykey"_n>();
	auto s_itr = by_key.find(split_key(owner, group_id, round));

	if (s_itr == by_key.end()) {
		splits.emplace(owner, [&](auto& col) {
			col.id = splits.available_primary_key();
			col.owner = owner;
			col.group_id = group_id;
			col.round = round;
			col.recipients = recipients;
			col.ratios = ratios;
		});
	} else {
		//last write in a round wins
		by_key.modify(s_itr, same_payer, [&](auto& col) {
			col.recipients = recipients;
			col.ratios = ratios;
		});
	}
}

ACTION groupservice::settle(uint64_t activity_key, uint64_t round) {
	//get config and activity
	auto conf = get_config();
	get_activity(activity_key);

	//validate
	check(round < current_round(conf), "round is not finished");

	settle_round(conf, activity_key, round);
}

ACTION groupservice::claimreward(name account, uint64_t activity_key, uint64_t round) {
	//authenticate
	require_auth(account);

	//get config and activity
	auto conf = get_config();
	get_activity(activity_key);

	//validate
	check(round < current_round(conf), "round is not finished");

	settle_round(conf, activity_key, round);

	uint64_t scope = round_scope(activity_key, round);

	//open rewards table, search for account
	rewards_table rewards(get_self(), scope);
	auto r_itr = rewards.find(account.value);

	if (r_itr == rewards.end()) {
		//nothing was generated, record the claim so it cannot repeat
		rewards.emplace(account, [&](auto& col) {
			col.account = account;
			col.generated = 0;
			col.amount = 0;
			col.eligible = is_on_roster(conf, activity_key, account, round);
			col.claimed = true;
		});
		return;
	}

	check(!r_itr->claimed, "reward already claimed");

	rewards.modify(r_itr, same_payer, [&](auto& col) {
		col.claimed = true;
	});

	//recipient amounts and owner residuals sum to the reward
	debit_pool(conf, activity_key, r_itr->amount);

	//pay recipients of each group, residuals go to the owner
	groupresults_table groupresults(get_self(), scope);
	auto by_owner = groupresults.get_index<"byowner"_n>();
	int64_t owner_total = 0;

	for (auto g_itr = by_owner.lower_bound(uint128_t(account.value) << 64);
		g_itr != by_owner.end() && g_itr->owner == account; g_itr++) {
		for (size_t i = 0; i < g_itr->recipients.size(); i++) {
			send_reward(conf, g_itr->recipients[i], g_itr->recipient_amounts[i], "group service recipient reward");
		}
		owner_total += g_itr->owner_amount;
	}

	send_reward(conf, account, owner_total, "group service reward");

	print("\n", account, " claimed ", r_itr->amount, " for round ", round);
}

ACTION groupservice::burnreward(uint64_t activity_key, uint64_t round) {
	//get config and activity
	auto conf = get_config();
	get_activity(activity_key);

	//validate
	check(round < current_round(conf), "round is not finished");

	//open burns table, search for round
	burns_table burns(get_self(), activity_key);
	auto b_itr = burns.find(round);

	//already burned
	if (b_itr != burns.end() && b_itr->burned) {
		return;
	}

	auto stats = settle_round(conf, activity_key, round);
	int64_t burn_amount = stats.service_reward - stats.total_reward;

	if (b_itr == burns.end()) {
		burns.emplace(get_self(), [&](auto& col) {
			col.round = round;
			col.amount = burn_amount;
			col.burned = true;
		});
	} else {
		burns.modify(b_itr, same_payer, [&](auto& col) {
			col.amount = burn_amount;
			col.burned = true;
		});
	}

	if (burn_amount > 0) {
		debit_pool(conf, activity_key, burn_amount);

		action(permission_level{get_self(), "active"_n}, conf.token_contract, "transfer"_n, make_tuple(
			get_self(), //from
			conf.burn_account, //to
			asset(burn_amount, conf.reward_symbol), //quantity
			string("group service burn") //memo
		)).send();
	}

	print("\nround ", round, " burned ", burn_amount);
}

//========== utility methods ==========

bool groupservice::recipients_at(uint64_t activity_key, name owner, uint64_t group_id, uint64_t round,
	vector<name>& recipients, vector<uint64_t>& ratios) {
	recipients_table splits(get_self(), activity_key);
	auto by_key = splits.get_index<"bykey"_n>();

	//latest split at or before round
	auto s_itr = by_key.upper_bound(split_key(owner, group_id, round));

	if (s_itr == by_key.begin()) {
		return false;
	}

	--s_itr;

	if (s_itr->owner != owner || s_itr->group_id != group_id) {
		return false;
	}

	recipients = s_itr->recipients;
	ratios = s_itr->ratios;

	return true;
}

groupservice::roundstat groupservice::settle_round(const config& conf, uint64_t activity_key, uint64_t round) {
	//open roundstats table, return settled round
	roundstats_table roundstats(get_self(), activity_key);
	auto rs_itr = roundstats.find(round);

	if (rs_itr != roundstats.end()) {
		return *rs_itr;
	}

	//validate
	check(is_reward_minted(conf, activity_key, round), "round reward not yet minted");

	uint64_t scope = round_scope(activity_key, round);
	uint64_t total_votes = get_total_votes(conf, activity_key, round);
	int64_t service_reward = get_service_reward(conf, activity_key, round);

	verifications_table verifications(get_self(), scope);
	distrusts_table distrusts(get_self(), scope);
	groupresults_table groupresults(get_self(), scope);

	map<name, uint64_t> owner_generated;
	uint64_t total_generated = 0;
	uint32_t verified_groups = 0;

	//generated amount of each verified group
	for (const auto& ver : verifications) {
		auto d_itr = distrusts.find(ver.owner.value);
		uint64_t distrust_amount = d_itr == distrusts.end() ? 0 : d_itr->amount;
		uint64_t rate = groupmath::distrust_rate(true, distrust_amount, total_votes);
		uint64_t reduction = groupmath::distrust_reduction(true, distrust_amount, total_votes);
		uint64_t generated = groupmath::generated_amount(ver.verified_amount, reduction);

		groupresults.emplace(get_self(), [&](auto& col) {
			col.group_id = ver.group_id;
			col.owner = ver.owner;
			col.verified_amount = ver.verified_amount;
			col.distrust_amount = distrust_amount;
			col.total_votes = total_votes;
			col.distrust_rate = rate;
			col.distrust_reduction = reduction;
			col.generated = generated;
			col.reward = 0;
			col.owner_amount = 0;
		});

		owner_generated[ver.owner] += generated;
		total_generated += generated;
		verified_groups++;
	}

	//owner shares of the service reward
	rewards_table rewards(get_self(), scope);
	int64_t total_reward = 0;

	for (const auto& entry : owner_generated) {
		bool eligible = is_on_roster(conf, activity_key, entry.first, round);
		uint64_t amount = eligible ? groupmath::reward_share(uint64_t(service_reward), entry.second, total_generated) : 0;

		rewards.emplace(get_self(), [&](auto& col) {
			col.account = entry.first;
			col.generated = entry.second;
			col.amount = int64_t(amount);
			col.eligible = eligible;
			col.claimed = false;
		});

		allocate_group_rewards(groupresults, activity_key, round, entry.first, amount);
		total_reward += int64_t(amount);
	}

	roundstats.emplace(get_self(), [&](auto& col) {
		col.round = round;
		col.service_reward = service_reward;
		col.total_generated = total_generated;
		col.total_reward = total_reward;
		col.verified_groups = verified_groups;
	});

	print("\nround ", round, " settled with ", verified_groups, " verified groups, ",
		total_reward, " of ", service_reward, " rewarded");

	return roundstats.get(round);
}

void groupservice::allocate_group_rewards(groupresults_table& groupresults, uint64_t activity_key, uint64_t round,
	name owner, uint64_t amount) {
	auto by_owner = groupresults.get_index<"byowner"_n>();
	vector<uint64_t> group_ids;
	vector<uint64_t> weights;

	for (auto g_itr = by_owner.lower_bound(uint128_t(owner.value) << 64);
		g_itr != by_owner.end() && g_itr->owner == owner; g_itr++) {
		group_ids.push_back(g_itr->group_id);
		weights.push_back(g_itr->generated);
	}

	vector<uint64_t> parts = groupmath::allocate(amount, weights);

	for (size_t i = 0; i < group_ids.size(); i++) {
		vector<name> recipients;
		vector<uint64_t> ratios;
		recipients_at(activity_key, owner, group_ids[i], round, recipients, ratios);

		auto split = groupmath::split_reward(parts[i], ratios);

		auto& result = groupresults.get(group_ids[i], "group result missing");

		groupresults.modify(result, same_payer, [&](auto& col) {
			col.reward = int64_t(parts[i]);
			col.recipients = recipients;
			col.recipient_amounts = vector<int64_t>(split.amounts.begin(), split.amounts.end());
			col.owner_amount = int64_t(split.residual);
		});
	}
}
