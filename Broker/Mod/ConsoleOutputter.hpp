#ifndef BROKER_MOD_CONSOLEOUTPUTTER_HPP
#define BROKER_MOD_CONSOLEOUTPUTTER_HPP

#include<ostream>
#include<queue>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Broker { namespace Mod {

/** class Broker::Mod::ConsoleOutputter
 *
 * @brief writes each `Broker::Msg::CommandResponse`
 * as one line on the console, in the order the
 * responses were raised.
 */
class ConsoleOutputter {
private:
	std::ostream& cout;
	std::queue<std::string> outs;

	Ev::Io<void> loop();

public:
	ConsoleOutputter() =delete;
	ConsoleOutputter(ConsoleOutputter const&) =delete;

	ConsoleOutputter(std::ostream& cout, S::Bus& bus);
};

}}

#endif /* !defined(BROKER_MOD_CONSOLEOUTPUTTER_HPP) */
