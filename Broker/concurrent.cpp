#include"Broker/Shutdown.hpp"
#include"Broker/concurrent.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"

namespace Broker {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::concurrent(io.catching<Broker::Shutdown>([](Broker::Shutdown const&) {
		return Ev::lift();
	}));
}

}
