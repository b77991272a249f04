#include"Ev/Detail/run_queue.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include<iostream>

namespace {

/* Nobody waits on a detached greenthread, so its
 * failures can only be reported.  */
void report_escaped(std::exception_ptr e) {
	try {
		std::rethrow_exception(e);
	} catch (std::exception const& err) {
		std::cerr << "keybroker: greenthread failed: "
			  << err.what()
			  << std::endl;
	} catch (...) {
		std::cerr << "keybroker: greenthread failed with a "
			     "non-standard exception"
			  << std::endl;
	}
}

}

namespace Ev {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::Io<void>([io]( std::function<void()> pass
				, std::function<void(std::exception_ptr)>
				) {
		Detail::post([io]() {
			io.run([]() { }, &report_escaped);
		});
		pass();
	});
}

}
