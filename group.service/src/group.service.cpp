#include <group.service/group.service.hpp>

groupservice::groupservice(name self, name code, datastream<const char*> ds) : contract(self, code, ds) {}

groupservice::~groupservice() {}

//======================== admin actions ========================

ACTION groupservice::setconfig(name admin, name token_contract, symbol reward_symbol,
	name lifecycle, name roster, name governance, name pool, name burn_account,
	uint32_t round_length, uint16_t max_recipients, uint64_t max_origin_score) {
	//open config singleton
	config_singleton configs(get_self(), get_self().value);

	//initialize
	config new_config;

	if (configs.exists()) {
		//get config
		new_config = configs.get();

		//authenticate
		require_auth(new_config.admin);

		//validate
		check(round_length == new_config.round_length, "round length cannot change once set");
	} else {
		//authenticate
		require_auth(get_self());

		//validate
		check(round_length > 0, "round length must be greater than zero");

		//round 0 starts now
		new_config.round_origin = time_point_sec(current_time_point());
		new_config.round_length = round_length;
	}

	//validate
	check(is_account(admin), "admin account does not exist");
	check(is_account(token_contract), "token contract account does not exist");
	check(is_account(lifecycle), "lifecycle account does not exist");
	check(is_account(roster), "roster account does not exist");
	check(is_account(governance), "governance account does not exist");
	check(is_account(pool), "pool account does not exist");
	check(is_account(burn_account), "burn account does not exist");
	check(reward_symbol.is_valid(), "invalid reward symbol");

	new_config.admin = admin;
	new_config.token_contract = token_contract;
	new_config.reward_symbol = reward_symbol;
	new_config.lifecycle = lifecycle;
	new_config.roster = roster;
	new_config.governance = governance;
	new_config.pool = pool;
	new_config.burn_account = burn_account;
	new_config.max_recipients = max_recipients == 0 ? DEFAULT_MAX_RECIPIENTS : max_recipients;
	new_config.max_origin_score = max_origin_score == 0 ? DEFAULT_MAX_ORIGIN_SCORE : max_origin_score;

	//set new config
	configs.set(new_config, get_self());
}

ACTION groupservice::addactivity(symbol asset_sym, uint32_t action_id) {
	//get config
	auto conf = get_config();

	//authenticate
	require_auth(conf.admin);

	//validate
	check(asset_sym.is_valid(), "invalid asset symbol");

	//open activities table, search by asset and action
	activities_table activities(get_self(), get_self().value);
	auto by_action = activities.get_index<"byaction"_n>();
	uint128_t action_key = (uint128_t(asset_sym.code().raw()) << 64) | action_id;

	check(by_action.find(action_key) == by_action.end(), "activity already exists");

	uint64_t new_key = activities.available_primary_key();

	//NOTE: activity keys share a scope word with the round, see round_scope()
	check(new_key <= MAX_ACTIVITY_KEY, "activity catalog is full");

	//emplace new activity
	activities.emplace(get_self(), [&](auto& col) {
		col.activity_key = new_key;
		col.asset_sym = asset_sym;
		col.action_id = action_id;
	});

	print("\nactivity ", new_key, " registered for action ", action_id);
}

//======================== custody actions ========================

ACTION groupservice::withdraw(name owner, asset quantity) {
	//authenticate
	require_auth(owner);

	//get config
	auto conf = get_config();

	//validate
	check(quantity.is_valid(), "invalid quantity");
	check(quantity.amount > 0, "must withdraw a positive quantity");

	//charge deposit
	debit_deposit(owner, quantity);

	//transfer to owner
	action(permission_level{get_self(), "active"_n}, conf.token_contract, "transfer"_n, make_tuple(
		get_self(), //from
		owner, //to
		quantity, //quantity
		string("group service withdrawal") //memo
	)).send();
}

//======================== notification methods ========================

void groupservice::catch_transfer(name from, name to, asset quantity, string memo) {
	//skips transfers from self and notifications for other parties
	if (from == get_self() || to != get_self()) {
		return;
	}

	//get config
	auto conf = get_config();

	//get initial receiver contract
	name rec = get_first_receiver();

	//validate
	check(rec == conf.token_contract, "transfers must come from the configured token contract");

	//pool funding is earmarked for one activity
	if (memo.compare(0, POOL_MEMO_PREFIX.size(), POOL_MEMO_PREFIX) == 0) {
		string key_digits = memo.substr(POOL_MEMO_PREFIX.size());

		//validate
		check(!key_digits.empty() && key_digits.size() <= 10, "invalid pool memo");
		check(quantity.symbol == conf.reward_symbol, "pool must be funded in the reward symbol");

		uint64_t activity_key = 0;

		for (char c : key_digits) {
			check(c >= '0' && c <= '9', "invalid pool memo");
			activity_key = activity_key * 10 + uint64_t(c - '0');
		}

		credit_pool(activity_key, quantity);

		print("\npool of activity ", activity_key, " funded with ", quantity);
		return;
	}

	credit_deposit(from, quantity);
}

//========== utility methods ==========

groupservice::config groupservice::get_config() {
	//open config singleton
	config_singleton configs(get_self(), get_self().value);

	//validate
	check(configs.exists(), "contract is not configured");

	return configs.get();
}

uint64_t groupservice::current_round(const config& conf) {
	uint32_t now = current_time_point().sec_since_epoch();
	return (now - conf.round_origin.sec_since_epoch()) / conf.round_length;
}

groupservice::activity groupservice::get_activity(uint64_t activity_key) {
	activities_table activities(get_self(), get_self().value);
	return activities.get(activity_key, "activity not found");
}

group_info groupservice::get_group(const config& conf, uint64_t activity_key, uint64_t group_id) {
	ext_groups_table groups(conf.lifecycle, activity_key);
	return groups.get(group_id, "group not found");
}

void groupservice::credit_deposit(name owner, asset quantity) {
	//open deposits table, search for balance
	deposits_table deposits(get_self(), owner.value);
	auto d_itr = deposits.find(quantity.symbol.code().raw());

	if (d_itr == deposits.end()) {
		//emplace new deposit
		deposits.emplace(get_self(), [&](auto& col) {
			col.balance = quantity;
		});
	} else {
		//update existing balance
		deposits.modify(d_itr, same_payer, [&](auto& col) {
			col.balance += quantity;
		});
	}
}

void groupservice::debit_deposit(name owner, asset quantity) {
	//open deposits table, get balance
	deposits_table deposits(get_self(), owner.value);
	auto& dep = deposits.get(quantity.symbol.code().raw(), "insufficient deposit");

	//validate
	check(dep.balance.symbol == quantity.symbol, "quantity precision does not match deposit");
	check(dep.balance.amount >= quantity.amount, "insufficient deposit");

	if (dep.balance.amount == quantity.amount) {
		deposits.erase(dep);
	} else {
		deposits.modify(dep, same_payer, [&](auto& col) {
			col.balance -= quantity;
		});
	}
}

void groupservice::credit_pool(uint64_t activity_key, asset quantity) {
	//validate
	get_activity(activity_key);

	//open pools table, search for activity
	pools_table pools(get_self(), get_self().value);
	auto p_itr = pools.find(activity_key);

	if (p_itr == pools.end()) {
		pools.emplace(get_self(), [&](auto& col) {
			col.activity_key = activity_key;
			col.balance = quantity;
		});
	} else {
		pools.modify(p_itr, same_payer, [&](auto& col) {
			col.balance += quantity;
		});
	}
}

void groupservice::debit_pool(const config& conf, uint64_t activity_key, int64_t amount) {
	if (amount <= 0) {
		return;
	}

	//open pools table, search for activity
	pools_table pools(get_self(), get_self().value);
	auto p_itr = pools.find(activity_key);

	//validate
	check(p_itr != pools.end(), "insufficient pool balance");
	check(p_itr->balance.symbol == conf.reward_symbol, "pool symbol does not match reward symbol");
	check(p_itr->balance.amount >= amount, "insufficient pool balance");

	pools.modify(p_itr, same_payer, [&](auto& col) {
		col.balance.amount -= amount;
	});
}

void groupservice::send_reward(const config& conf, name to, int64_t amount, string memo) {
	if (amount <= 0) {
		return;
	}

	action(permission_level{get_self(), "active"_n}, conf.token_contract, "transfer"_n, make_tuple(
		get_self(), //from
		to, //to
		asset(amount, conf.reward_symbol), //quantity
		memo //memo
	)).send();
}

uint64_t groupservice::get_verifier_quota(const config& conf, uint64_t activity_key, uint64_t round, name voter) {
	ext_quotas_table quotas(conf.governance, round_scope(activity_key, round));
	auto q_itr = quotas.find(voter.value);
	return q_itr == quotas.end() ? 0 : q_itr->quota;
}

uint64_t groupservice::get_total_votes(const config& conf, uint64_t activity_key, uint64_t round) {
	ext_totalvotes_table totals(conf.governance, activity_key);
	auto t_itr = totals.find(round);
	return t_itr == totals.end() ? 0 : t_itr->total_votes;
}

int64_t groupservice::get_service_reward(const config& conf, uint64_t activity_key, uint64_t round) {
	ext_poolrewards_table poolrewards(conf.pool, activity_key);
	auto p_itr = poolrewards.find(round);

	if (p_itr == poolrewards.end() || p_itr->amount < 0) {
		return 0;
	}

	return p_itr->amount;
}

bool groupservice::is_reward_minted(const config& conf, uint64_t activity_key, uint64_t round) {
	ext_poolrewards_table poolrewards(conf.pool, activity_key);
	return poolrewards.find(round) != poolrewards.end();
}

bool groupservice::is_on_roster(const config& conf, uint64_t activity_key, name account, uint64_t round) {
	ext_roster_table roster(conf.roster, activity_key);
	auto r_itr = roster.find(account.value);

	if (r_itr == roster.end() || r_itr->join_round > round) {
		return false;
	}

	return !(r_itr->exited && r_itr->exit_round <= round);
}
