#include<Broker/Main.hpp>
#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<iostream>
#include<memory>
#include<string>
#include<vector>

namespace {

Ev::Io<int> broker_main(std::vector<std::string> argv) {
	auto broker = std::make_shared<Broker::Main>(
		std::move(argv), std::cin, std::cout, std::cerr
	);
	/* broker must outlive its run.  */
	return broker->run().then([broker](int exit_code) {
		return Ev::lift(exit_code);
	});
}

}

int main(int argc, char** argv) {
	auto args = std::vector<std::string>(argv, argv + argc);
	/* Build the action before starting the loop; starting it
	 * straight from the call expression crashed when stdin
	 * already had data waiting.  */
	auto action = broker_main(std::move(args));
	return Ev::start(std::move(action));
}
