#include <group.mock/group.mock.hpp>

//======================== lifecycle actions ========================

ACTION groupmock::setgroup(uint64_t activity_key, uint64_t group_id, name owner, bool is_active,
	int64_t min_join, int64_t max_join, uint32_t max_accounts) {
	require_auth(get_self());

	ext_groups_table groups(get_self(), activity_key);
	auto g_itr = groups.find(group_id);

	if (g_itr == groups.end()) {
		groups.emplace(get_self(), [&](auto& col) {
			col.group_id = group_id;
			col.owner = owner;
			col.is_active = is_active;
			col.min_join = min_join;
			col.max_join = max_join;
			col.max_accounts = max_accounts;
		});
	} else {
		groups.modify(g_itr, same_payer, [&](auto& col) {
			col.owner = owner;
			col.is_active = is_active;
			col.min_join = min_join;
			col.max_join = max_join;
			col.max_accounts = max_accounts;
		});
	}
}

//======================== roster actions ========================

ACTION groupmock::setroster(uint64_t activity_key, name account, uint32_t join_round, bool exited, uint32_t exit_round) {
	require_auth(get_self());

	ext_roster_table roster(get_self(), activity_key);
	auto r_itr = roster.find(account.value);

	if (r_itr == roster.end()) {
		roster.emplace(get_self(), [&](auto& col) {
			col.account = account;
			col.join_round = join_round;
			col.exited = exited;
			col.exit_round = exit_round;
		});
	} else {
		roster.modify(r_itr, same_payer, [&](auto& col) {
			col.join_round = join_round;
			col.exited = exited;
			col.exit_round = exit_round;
		});
	}
}

//======================== governance actions ========================

ACTION groupmock::setquota(uint64_t activity_key, uint64_t round, name voter, uint64_t quota) {
	require_auth(get_self());

	ext_quotas_table quotas(get_self(), round_scope(activity_key, round));
	auto q_itr = quotas.find(voter.value);

	if (q_itr == quotas.end()) {
		quotas.emplace(get_self(), [&](auto& col) {
			col.voter = voter;
			col.quota = quota;
		});
	} else {
		quotas.modify(q_itr, same_payer, [&](auto& col) {
			col.quota = quota;
		});
	}
}

ACTION groupmock::settotal(uint64_t activity_key, uint64_t round, uint64_t total_votes) {
	require_auth(get_self());

	ext_totalvotes_table totals(get_self(), activity_key);
	auto t_itr = totals.find(round);

	if (t_itr == totals.end()) {
		totals.emplace(get_self(), [&](auto& col) {
			col.round = round;
			col.total_votes = total_votes;
		});
	} else {
		totals.modify(t_itr, same_payer, [&](auto& col) {
			col.total_votes = total_votes;
		});
	}
}

//======================== pool actions ========================

ACTION groupmock::setpool(uint64_t activity_key, uint64_t round, int64_t amount) {
	require_auth(get_self());

	ext_poolrewards_table poolrewards(get_self(), activity_key);
	auto p_itr = poolrewards.find(round);

	if (p_itr == poolrewards.end()) {
		poolrewards.emplace(get_self(), [&](auto& col) {
			col.round = round;
			col.amount = amount;
		});
	} else {
		poolrewards.modify(p_itr, same_payer, [&](auto& col) {
			col.amount = amount;
		});
	}
}

//======================== token actions ========================

ACTION groupmock::issue(name to, asset quantity) {
	require_auth(get_self());

	check(quantity.is_valid(), "invalid quantity");
	check(quantity.amount > 0, "must issue positive quantity");

	add_balance(to, quantity);
}

ACTION groupmock::transfer(name from, name to, asset quantity, string memo) {
	require_auth(from);

	check(from != to, "cannot transfer to self");
	check(is_account(to), "to account does not exist");
	check(quantity.is_valid(), "invalid quantity");
	check(quantity.amount > 0, "must transfer positive quantity");
	check(memo.size() <= 256, "memo has more than 256 bytes");

	require_recipient(from);
	require_recipient(to);

	sub_balance(from, quantity);
	add_balance(to, quantity);
}

//========== utility methods ==========

void groupmock::add_balance(name owner, asset quantity) {
	accounts_table accounts(get_self(), owner.value);
	auto a_itr = accounts.find(quantity.symbol.code().raw());

	if (a_itr == accounts.end()) {
		accounts.emplace(get_self(), [&](auto& col) {
			col.balance = quantity;
		});
	} else {
		accounts.modify(a_itr, same_payer, [&](auto& col) {
			col.balance += quantity;
		});
	}
}

void groupmock::sub_balance(name owner, asset quantity) {
	accounts_table accounts(get_self(), owner.value);
	auto& acct = accounts.get(quantity.symbol.code().raw(), "no balance object found");

	check(acct.balance.amount >= quantity.amount, "overdrawn balance");

	accounts.modify(acct, same_payer, [&](auto& col) {
		col.balance -= quantity;
	});
}
