#include <group.service/group.service.hpp>

//======================== membership actions ========================

ACTION groupservice::joingroup(name account, uint64_t activity_key, uint64_t group_id, asset quantity) {
	//authenticate
	require_auth(account);

	//get config, activity, and group
	auto conf = get_config();
	auto act = get_activity(activity_key);
	auto grp = get_group(conf, activity_key, group_id);

	//validate
	check(grp.is_active, "group is not active");
	check(quantity.is_valid(), "invalid quantity");
	check(quantity.symbol == act.asset_sym, "quantity must be in the activity asset");
	check(quantity.amount > 0, "must join with a positive quantity");

	//open members table, search for account
	members_table members(get_self(), activity_key);
	auto m_itr = members.find(account.value);
	bool is_new = m_itr == members.end();
	int64_t new_amount = quantity.amount;

	if (!is_new) {
		check(m_itr->group_id == group_id, "account already joined another group in this activity");
		new_amount += m_itr->amount;
	}

	//validate against group bounds
	check(new_amount >= grp.min_join, "join amount below group minimum");
	check(grp.max_join == 0 || new_amount <= grp.max_join, "join amount exceeds group maximum");

	if (is_new && grp.max_accounts > 0) {
		groupstats_table groupstats(get_self(), activity_key);
		auto gs_itr = groupstats.find(group_id);
		uint32_t accounts = gs_itr == groupstats.end() ? 0 : gs_itr->accounts;

		check(accounts < grp.max_accounts, "group is full");
	}

	//take stake from deposit
	debit_deposit(account, quantity);

	if (is_new) {
		//emplace new member
		members.emplace(account, [&](auto& col) {
			col.account = account;
			col.group_id = group_id;
			col.amount = quantity.amount;
			col.join_round = current_round(conf);
		});
	} else {
		//update existing stake
		members.modify(m_itr, same_payer, [&](auto& col) {
			col.amount += quantity.amount;
		});
	}

	index_join(act, account, group_id, grp.owner, quantity.amount, is_new);
}

ACTION groupservice::exitgroup(name account, uint64_t activity_key) {
	//authenticate
	require_auth(account);

	//get config and activity
	get_config();
	auto act = get_activity(activity_key);

	//open members table, get member
	members_table members(get_self(), activity_key);
	auto& mem = members.get(account.value, "account is not a member of this activity");

	index_exit(act, mem);

	//return stake to deposit
	credit_deposit(account, asset(mem.amount, act.asset_sym));

	//erase member
	members.erase(mem);
}

//========== utility methods ==========

void groupservice::index_join(const activity& act, name account, uint64_t group_id, name owner, int64_t amount, bool is_new) {
	uint64_t asset_scope = act.asset_sym.code().raw();

	//activity -> groups
	groupstats_table groupstats(get_self(), act.activity_key);
	auto gs_itr = groupstats.find(group_id);
	bool is_new_group = gs_itr == groupstats.end();

	if (is_new_group) {
		groupstats.emplace(get_self(), [&](auto& col) {
			col.group_id = group_id;
			col.owner = owner;
			col.accounts = 1;
			col.total_amount = amount;
		});
	} else {
		//NOTE: keep counting under the owner the group was indexed with
		owner = gs_itr->owner;

		groupstats.modify(gs_itr, same_payer, [&](auto& col) {
			col.accounts += is_new ? 1 : 0;
			col.total_amount += amount;
		});
	}

	//activity -> owners
	ownerstats_table ownerstats(get_self(), act.activity_key);
	auto os_itr = ownerstats.find(owner.value);

	if (os_itr == ownerstats.end()) {
		ownerstats.emplace(get_self(), [&](auto& col) {
			col.owner = owner;
			col.groups = 1;
			col.accounts = 1;
			col.total_amount = amount;
		});
	} else {
		ownerstats.modify(os_itr, same_payer, [&](auto& col) {
			col.groups += is_new_group ? 1 : 0;
			col.accounts += is_new ? 1 : 0;
			col.total_amount += amount;
		});
	}

	//asset -> activities
	actstats_table actstats(get_self(), asset_scope);
	auto as_itr = actstats.find(act.activity_key);

	if (as_itr == actstats.end()) {
		actstats.emplace(get_self(), [&](auto& col) {
			col.activity_key = act.activity_key;
			col.accounts = 1;
			col.total_amount = amount;
		});
	} else {
		actstats.modify(as_itr, same_payer, [&](auto& col) {
			col.accounts += is_new ? 1 : 0;
			col.total_amount += amount;
		});
	}

	//asset -> accounts
	assetaccts_table assetaccts(get_self(), asset_scope);
	auto aa_itr = assetaccts.find(account.value);

	if (aa_itr == assetaccts.end()) {
		assetaccts.emplace(account, [&](auto& col) {
			col.account = account;
			col.activities = 1;
			col.total_amount = amount;
		});
	} else {
		assetaccts.modify(aa_itr, same_payer, [&](auto& col) {
			col.activities += is_new ? 1 : 0;
			col.total_amount += amount;
		});
	}

	//account -> activities
	acctacts_table acctacts(get_self(), account.value);

	if (is_new) {
		acctacts.emplace(account, [&](auto& col) {
			col.activity_key = act.activity_key;
			col.asset_code = act.asset_sym.code();
			col.group_id = group_id;
			col.amount = amount;
		});

		//account -> assets
		acctassets_table acctassets(get_self(), account.value);
		auto ac_itr = acctassets.find(asset_scope);

		if (ac_itr == acctassets.end()) {
			acctassets.emplace(account, [&](auto& col) {
				col.asset_code = act.asset_sym.code();
				col.activities = 1;
			});
		} else {
			acctassets.modify(ac_itr, same_payer, [&](auto& col) {
				col.activities += 1;
			});
		}
	} else {
		auto& aact = acctacts.get(act.activity_key, "account activity index missing");

		acctacts.modify(aact, same_payer, [&](auto& col) {
			col.amount += amount;
		});
	}
}

void groupservice::index_exit(const activity& act, const member& mem) {
	uint64_t asset_scope = act.asset_sym.code().raw();

	//activity -> groups
	groupstats_table groupstats(get_self(), act.activity_key);
	auto& gstat = groupstats.get(mem.group_id, "group index missing");
	name owner = gstat.owner;
	bool group_emptied = gstat.accounts <= 1;

	if (group_emptied) {
		groupstats.erase(gstat);
	} else {
		groupstats.modify(gstat, same_payer, [&](auto& col) {
			col.accounts -= 1;
			col.total_amount -= mem.amount;
		});
	}

	//activity -> owners
	ownerstats_table ownerstats(get_self(), act.activity_key);
	auto& ostat = ownerstats.get(owner.value, "owner index missing");

	if (ostat.accounts <= 1) {
		ownerstats.erase(ostat);
	} else {
		ownerstats.modify(ostat, same_payer, [&](auto& col) {
			col.groups -= group_emptied ? 1 : 0;
			col.accounts -= 1;
			col.total_amount -= mem.amount;
		});
	}

	//asset -> activities
	actstats_table actstats(get_self(), asset_scope);
	auto& astat = actstats.get(act.activity_key, "activity index missing");

	if (astat.accounts <= 1) {
		actstats.erase(astat);
	} else {
		actstats.modify(astat, same_payer, [&](auto& col) {
			col.accounts -= 1;
			col.total_amount -= mem.amount;
		});
	}

	//asset -> accounts
	assetaccts_table assetaccts(get_self(), asset_scope);
	auto& aacct = assetaccts.get(mem.account.value, "asset account index missing");

	if (aacct.activities <= 1) {
		assetaccts.erase(aacct);
	} else {
		assetaccts.modify(aacct, same_payer, [&](auto& col) {
			col.activities -= 1;
			col.total_amount -= mem.amount;
		});
	}

	//account -> activities
	acctacts_table acctacts(get_self(), mem.account.value);
	auto& aact = acctacts.get(act.activity_key, "account activity index missing");
	acctacts.erase(aact);

	//account -> assets
	acctassets_table acctassets(get_self(), mem.account.value);
	auto& aasset = acctassets.get(asset_scope, "account asset index missing");

	if (aasset.activities <= 1) {
		acctassets.erase(aasset);
	} else {
		acctassets.modify(aasset, same_payer, [&](auto& col) {
			col.activities -= 1;
		});
	}
}
