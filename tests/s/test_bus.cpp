#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>
#include<vector>

namespace {

struct Ping { int n; };
struct Pong { std::string text; };
struct Boom { };

}

int main() {
	auto bus = S::Bus();
	auto log = std::vector<std::string>();

	auto code = Ev::lift().then([&]() {
		/* Nobody listening: fine.  */
		assert(bus.subscribers<Ping>() == 0);
		return bus.raise(Ping{1});
	}).then([&]() {
		bus.subscribe<Ping>([&](Ping const& p) {
			log.push_back("a" + std::to_string(p.n));
			/* Gets suspended so the next subscriber
			 * starts before this one finishes.  */
			return Ev::yield().then([&, p]() {
				log.push_back("a" + std::to_string(p.n) + "-done");
				return Ev::lift();
			});
		});
		bus.subscribe<Ping>([&](Ping const& p) {
			log.push_back("b" + std::to_string(p.n));
			/* Raising from inside a subscriber.  */
			return bus.raise(Pong{"from b"});
		});
		bus.subscribe<Pong>([&](Pong const& p) {
			log.push_back(p.text);
			return Ev::lift();
		});
		assert(bus.subscribers<Ping>() == 2);
		assert(bus.subscribers<Pong>() == 1);
		return bus.raise(Ping{2});
	}).then([&]() {
		/* The raise completes only after every
		 * subscriber, nested raises included.  */
		assert(log.size() == 4);
		auto found = 0;
		for (auto const& l : log)
			if (l == "a2" || l == "b2" || l == "from b" || l == "a2-done")
				++found;
		assert(found == 4);

		/* Types are strict.  */
		log.clear();
		return bus.raise(Pong{"direct"});
	}).then([&]() {
		assert(log.size() == 1);
		assert(log[0] == "direct");

		/* A failing subscriber fails the raise, but the
		 * others still run.  */
		bus.subscribe<Boom>([&](Boom const&) {
			return Ev::lift().then([]() {
				throw std::runtime_error("boom");
				return Ev::lift();
			});
		});
		bus.subscribe<Boom>([&](Boom const&) {
			log.push_back("survivor");
			return Ev::lift();
		});
		log.clear();
		return bus.raise(Boom()).then([]() {
			return Ev::lift(false);
		}).catching<std::runtime_error>([](std::runtime_error const& e) {
			assert(std::string(e.what()) == "boom");
			return Ev::lift(true);
		});
	}).then([&](bool failed) {
		assert(failed);
		assert(log.size() == 1);
		assert(log[0] == "survivor");
		return Ev::lift(0);
	});

	return Ev::start(code);
}
