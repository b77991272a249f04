#ifndef BROKER_MAIN_HPP
#define BROKER_MAIN_HPP

#include<istream>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Broker {

/** class Broker::Main
 *
 * @brief the whole `keybroker` process: parses the
 * command line, opens the ledger, starts the
 * modules and serves console commands from `cin`
 * until end-of-file.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() =delete;
	Main(Main const&) =delete;
	Main( std::vector<std::string> argv
	    , std::istream& in
	    , std::ostream& out
	    , std::ostream& err
	    );
	Main(Main&&);
	~Main();

	/* Yields the process exit code.  */
	Ev::Io<int> run();
};

}

#endif /* !defined(BROKER_MAIN_HPP) */
