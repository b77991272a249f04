#ifndef LEDGER_SETTINGS_HPP
#define LEDGER_SETTINGS_HPP

#include"Ledger/Rounds.hpp"
#include<cstdint>
#include<map>
#include<string>
#include<vector>

namespace Ledger {

/** struct Ledger::Settings
 *
 * @brief the runtime settings, with their defaults
 * overlaid by whatever overrides are stored in the
 * `config` table.
 *
 * @desc Stored under these keys:
 *
 * - `role_id`: role an end user must hold; unset
 *   until an administrator sets it.
 * - `age_bound`: minimum account age in days, >= 0.
 * - `giveaway_duration`: length of a giveaway post
 *   in seconds, > 0.
 * - `current_round`: the last round opened, kept in
 *   step by the round manager; 0 if none.
 */
struct Settings {
	bool has_role_id;
	std::string role_id;
	std::int64_t age_bound;
	std::int64_t giveaway_duration;
	RoundNumber current_round;

	static std::int64_t const default_age_bound = 5;
	static std::int64_t const default_giveaway_duration = 3600;

	Settings() : has_role_id(false)
		   , role_id()
		   , age_bound(default_age_bound)
		   , giveaway_duration(default_giveaway_duration)
		   , current_round(0)
		   { }

	/* Keys accepted by `apply`, in display order.  */
	static std::vector<std::string> const& keys();

	/** Ledger::Settings::apply
	 *
	 * @brief sets the field stored under `key` from
	 * its text form.
	 *
	 * @desc Returns false, leaving the record
	 * untouched, if the key is unknown or the value
	 * does not parse or is out of range.
	 */
	bool apply(std::string const& key, std::string const& value);

	/* Applies every pair, skipping (and returning)
	 * the keys that `apply` refused.  */
	std::vector<std::string>
	overlay(std::map<std::string, std::string> const& stored);

	/* Text form of the field under `key`, as `apply`
	 * accepts it.  Empty if unknown or unset.  */
	std::string get(std::string const& key) const;
};

}

#endif /* !defined(LEDGER_SETTINGS_HPP) */
