#include"Ledger/Settings.hpp"
#include"Util/Str.hpp"
#include<sstream>

namespace Ledger {

std::int64_t const Settings::default_age_bound;
std::int64_t const Settings::default_giveaway_duration;

std::vector<std::string> const& Settings::keys() {
	static auto const rv = std::vector<std::string>{
		"role_id", "age_bound", "giveaway_duration", "current_round"
	};
	return rv;
}

bool Settings::apply(std::string const& key, std::string const& value) {
	auto num = std::int64_t();
	auto v = Util::Str::trim(value);
	if (key == "role_id") {
		if (v.empty())
			return false;
		has_role_id = true;
		role_id = v;
		return true;
	} else if (key == "age_bound") {
		if (!Util::Str::parse_int(v, num) || num < 0)
			return false;
		age_bound = num;
		return true;
	} else if (key == "giveaway_duration") {
		if (!Util::Str::parse_int(v, num) || num <= 0)
			return false;
		giveaway_duration = num;
		return true;
	} else if (key == "current_round") {
		if (!Util::Str::parse_int(v, num) || num < 0)
			return false;
		current_round = num;
		return true;
	}
	return false;
}

std::vector<std::string>
Settings::overlay(std::map<std::string, std::string> const& stored) {
	auto refused = std::vector<std::string>();
	for (auto const& e : stored)
		if (!apply(e.first, e.second))
			refused.push_back(e.first);
	return refused;
}

std::string Settings::get(std::string const& key) const {
	auto os = std::ostringstream();
	if (key == "role_id") {
		if (has_role_id)
			os << role_id;
	} else if (key == "age_bound")
		os << age_bound;
	else if (key == "giveaway_duration")
		os << giveaway_duration;
	else if (key == "current_round")
		os << current_round;
	return os.str();
}

}
