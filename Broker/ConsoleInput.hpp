#ifndef BROKER_CONSOLEINPUT_HPP
#define BROKER_CONSOLEINPUT_HPP

#include<istream>
#include<memory>

namespace Ev { template<typename a> class Io; }
namespace Ev { class ThreadPool; }
namespace S { class Bus; }

namespace Broker {

/** class Broker::ConsoleInput
 *
 * @brief special module that reads command lines
 * from the given stream and raises a
 * `Broker::Msg::CommandRequest` for each.
 *
 * @desc Blank lines and lines starting with `#`
 * are skipped.
 * The `run` action completes at end-of-file.
 * Each command is raised after the previous one
 * was answered, so responses come out in input
 * order.
 */
class ConsoleInput {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	ConsoleInput( Ev::ThreadPool& threadpool
		    , std::istream& cin
		    , S::Bus& bus
		    );
	ConsoleInput(ConsoleInput&&);
	~ConsoleInput();

	Ev::Io<void> run();
};

}

#endif /* !defined(BROKER_CONSOLEINPUT_HPP) */
