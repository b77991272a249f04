#include"Broker/ConsoleInput.hpp"
#include"Broker/Msg/CommandRequest.hpp"
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<cstdint>
#include<string>

namespace Broker {

class ConsoleInput::Impl {
private:
	Ev::ThreadPool& threadpool;
	std::istream& cin;
	S::Bus& bus;
	std::uint64_t next_id;

public:
	Impl( Ev::ThreadPool& threadpool_
	    , std::istream& cin_
	    , S::Bus& bus_
	    ) : threadpool(threadpool_)
	      , cin(cin_)
	      , bus(bus_)
	      , next_id(0)
	      { }

	Ev::Io<void> run() {
		return threadpool.background<std::unique_ptr<std::string>>([this]() {
			auto line = std::string();
			if (!std::getline(cin, line))
				return std::unique_ptr<std::string>();
			return Util::make_unique<std::string>(std::move(line));
		}).then([this](std::unique_ptr<std::string> pline) {
			if (!pline)
				/* Exit loop.  */
				return Ev::lift();

			auto words = Util::Str::words(*pline);
			if (words.empty() || words[0][0] == '#')
				return run();

			auto req = Msg::CommandRequest();
			req.id = next_id++;
			req.command = words[0];
			req.args.assign(words.begin() + 1, words.end());
			return bus.raise(std::move(req))
			     + run()
			     ;
		});
	}
};

ConsoleInput::ConsoleInput( Ev::ThreadPool& threadpool
			  , std::istream& cin
			  , S::Bus& bus
			  ) : pimpl(Util::make_unique<Impl>(threadpool, cin, bus)) { }
ConsoleInput::ConsoleInput(ConsoleInput&& o) : pimpl(std::move(o.pimpl)) { }
ConsoleInput::~ConsoleInput() { }

Ev::Io<void> ConsoleInput::run() {
	return pimpl->run();
}

}
