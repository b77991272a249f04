#include"Broker/Mod/Waiter.hpp"
#include"Broker/Shutdown.hpp"
#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<cstdint>
#include<functional>
#include<ev.h>
#include<map>

namespace Broker { namespace Mod {

class Waiter::Impl {
public:
	struct Alarm {
		ev_timer watcher;
		Impl* owner;
		std::uint64_t id;
		std::function<void()> wake;
		std::function<void(std::exception_ptr)> abort;
	};

	bool closed;
	std::uint64_t next_id;
	std::map<std::uint64_t, std::unique_ptr<Alarm>> alarms;

	Impl() : closed(false), next_id(0) { }
	~Impl() {
		for (auto& e : alarms)
			ev_timer_stop(EV_DEFAULT_ &e.second->watcher);
	}

	std::unique_ptr<Alarm> take(std::uint64_t id) {
		auto it = alarms.find(id);
		auto alarm = std::move(it->second);
		alarms.erase(it);
		ev_timer_stop(EV_DEFAULT_ &alarm->watcher);
		return alarm;
	}

	static
	void ring(EV_P_ ev_timer* w, int) {
		auto alarm = static_cast<Alarm*>(w->data);
		alarm->owner->take(alarm->id)->wake();
	}

	void close() {
		closed = true;
		while (!alarms.empty()) {
			auto alarm = take(alarms.begin()->first);
			alarm->abort(std::make_exception_ptr(Broker::Shutdown()));
		}
	}
};

Waiter::Waiter(S::Bus& bus) : pimpl(Util::make_unique<Impl>()) {
	auto impl = pimpl.get();
	bus.subscribe<Broker::Shutdown>([impl](Broker::Shutdown const&) {
		impl->close();
		return Ev::lift();
	});
}
Waiter::~Waiter() { }

Ev::Io<void> Waiter::wait(double seconds) {
	auto impl = pimpl.get();
	return Ev::Io<void>([impl, seconds]( std::function<void()> pass
					   , std::function<void(std::exception_ptr)> fail
					   ) {
		if (impl->closed)
			return fail(std::make_exception_ptr(Broker::Shutdown()));

		auto alarm = Util::make_unique<Impl::Alarm>();
		alarm->id = impl->next_id++;
		alarm->wake = std::move(pass);
		alarm->abort = std::move(fail);
		ev_timer_init(&alarm->watcher, &Impl::ring, seconds, 0);
		alarm->watcher.data = alarm.get();
		alarm->owner = impl;
		ev_timer_start(EV_DEFAULT_ &alarm->watcher);
		impl->alarms[alarm->id] = std::move(alarm);
	});
}
std::size_t Waiter::pending() const {
	return pimpl->alarms.size();
}

}}
