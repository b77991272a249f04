#ifndef BROKER_OPTIONS_HPP
#define BROKER_OPTIONS_HPP

#include"Broker/log.hpp"
#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Broker {

/** struct Broker::Options
 *
 * @brief the command line of the `keybroker`
 * process.
 *
 * @desc Options are given as `--name=value` or
 * `--name value`.
 */
struct Options {
	std::string db_path;
	std::string keys_file;
	/* Seconds between key file passes, 0 to disable.  */
	std::int64_t ingest_interval;
	std::size_t pool_size;
	int busy_timeout_ms;
	std::int64_t giveaway_duration;
	std::int64_t age_bound;
	bool strict_rounds;
	LogLevel log_level;

	bool show_version;
	bool show_help;

	Options();

	struct Invalid : public Util::BacktraceException<std::invalid_argument> {
		explicit
		Invalid(std::string const& msg)
			: Util::BacktraceException<std::invalid_argument>(msg)
			{ }
	};

	/** Broker::Options::parse
	 *
	 * @brief parses `argv`, including the program
	 * name in `argv[0]`.
	 *
	 * @desc Throws `Broker::Options::Invalid` on an
	 * unknown option or a malformed value.
	 */
	static Options parse(std::vector<std::string> const& argv);

	static std::string usage(std::string const& argv0);
};

}

#endif /* !defined(BROKER_OPTIONS_HPP) */
