#include"Broker/Mod/ConsoleOutputter.hpp"
#include"Broker/Msg/CommandResponse.hpp"
#include"Broker/concurrent.hpp"
#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"

namespace Broker { namespace Mod {

ConsoleOutputter::ConsoleOutputter( std::ostream& cout_
				  , S::Bus& bus
				  ) : cout(cout_) {
	bus.subscribe<Msg::CommandResponse>([this](Msg::CommandResponse const& r) {
		auto line = std::string(r.ok ? "ok " : "error ") + r.command;
		if (!r.details.empty())
			line += " " + r.details;

		auto start = outs.empty();
		outs.push(std::move(line));
		if (!start)
			return Ev::lift();
		return Broker::concurrent(loop());
	});
}

Ev::Io<void> ConsoleOutputter::loop() {
	return Ev::yield().then([this]() {
		if (outs.empty())
			return Ev::lift();
		cout << outs.front() << std::endl;
		outs.pop();
		return loop();
	});
}

}}
