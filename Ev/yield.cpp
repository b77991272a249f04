#include"Ev/Detail/run_queue.hpp"
#include"Ev/Io.hpp"
#include"Ev/yield.hpp"

namespace Ev {

Io<void> yield() {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)>
			  ) {
		Detail::post(std::move(pass));
	});
}

Io<void> yield(std::size_t num_yields) {
	auto rv = Ev::lift();
	for (auto i = std::size_t(0); i < num_yields; ++i)
		rv += yield();
	return rv;
}

}
