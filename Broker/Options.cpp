#include"Broker/Options.hpp"
#include"Util/Str.hpp"
#include<initializer_list>
#include<sstream>

namespace {

std::int64_t
parse_number( std::string const& name
	    , std::string const& value
	    , std::int64_t min
	    , std::int64_t max
	    ) {
	auto rv = std::int64_t();
	if (!Util::Str::parse_int(value, rv) || rv < min || rv > max)
		throw Broker::Options::Invalid(
			"Bad value for --" + name + ": " + value
		);
	return rv;
}

Broker::LogLevel parse_level(std::string const& value) {
	for (auto l : { Broker::Trace, Broker::Debug, Broker::Info
		      , Broker::Warn, Broker::Error
		      })
		if (value == Broker::log_level_name(l))
			return l;
	throw Broker::Options::Invalid("Bad value for --log-level: " + value);
}

}

namespace Broker {

Options::Options()
	: db_path("beta_keys.db")
	, keys_file("./fresh_keys.txt")
	, ingest_interval(30)
	, pool_size(4)
	, busy_timeout_ms(5000)
	, giveaway_duration(3600)
	, age_bound(5)
	, strict_rounds(false)
	, log_level(Info)
	, show_version(false)
	, show_help(false)
	{ }

Options Options::parse(std::vector<std::string> const& argv) {
	auto rv = Options();

	auto i = std::size_t(1);
	while (i < argv.size()) {
		auto arg = argv[i];
		++i;

		if (arg == "--version" || arg == "-V") {
			rv.show_version = true;
			continue;
		}
		if (arg == "--help" || arg == "-H") {
			rv.show_help = true;
			continue;
		}
		if (arg == "--strict-rounds") {
			rv.strict_rounds = true;
			continue;
		}
		if (arg.size() < 3 || arg.substr(0, 2) != "--")
			throw Invalid("Unrecognized argument: " + arg);

		auto name = arg.substr(2);
		auto value = std::string();
		auto eq = name.find('=');
		if (eq != std::string::npos) {
			value = name.substr(eq + 1);
			name = name.substr(0, eq);
		} else {
			if (i == argv.size())
				throw Invalid("Missing value for --" + name);
			value = argv[i];
			++i;
		}

		if (name == "db") {
			if (value.empty())
				throw Invalid("Empty --db");
			rv.db_path = value;
		} else if (name == "keys-file") {
			if (value.empty())
				throw Invalid("Empty --keys-file");
			rv.keys_file = value;
		} else if (name == "ingest-interval")
			rv.ingest_interval = parse_number(name, value, 0, 86400 * 365);
		else if (name == "pool-size")
			rv.pool_size = std::size_t(parse_number(name, value, 1, 1024));
		else if (name == "busy-timeout")
			rv.busy_timeout_ms = int(parse_number(name, value, 0, 3600000));
		else if (name == "giveaway-duration")
			rv.giveaway_duration = parse_number(name, value, 1, INT64_MAX);
		else if (name == "age-bound")
			rv.age_bound = parse_number(name, value, 0, INT64_MAX);
		else if (name == "log-level")
			rv.log_level = parse_level(value);
		else
			throw Invalid("Unrecognized option: --" + name);
	}

	return rv;
}

std::string Options::usage(std::string const& argv0) {
	auto os = std::ostringstream();
	os << "Usage: " << argv0 << " [options] < commands" << std::endl
	   << std::endl
	   << "Options:" << std::endl
	   << " --db=FILE                   SQLite database (default beta_keys.db)." << std::endl
	   << " --keys-file=FILE            Key source file (default ./fresh_keys.txt)." << std::endl
	   << " --ingest-interval=SECONDS   Key file polling period, 0 disables (default 30)." << std::endl
	   << " --pool-size=N               Concurrent ledger operations (default 4)." << std::endl
	   << " --busy-timeout=MS           SQLite busy timeout (default 5000)." << std::endl
	   << " --giveaway-duration=SECONDS Default giveaway_duration (default 3600)." << std::endl
	   << " --age-bound=DAYS            Default age_bound (default 5)." << std::endl
	   << " --strict-rounds             Only open rounds above every earlier one." << std::endl
	   << " --log-level=LEVEL           trace, debug, info, warn or error (default info)." << std::endl
	   << " --version, -V               Show version." << std::endl
	   << " --help, -H                  Show this help." << std::endl
	   ;
	return os.str();
}

}
