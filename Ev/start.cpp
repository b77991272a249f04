#include"Ev/Detail/run_queue.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include<ev.h>
#include<iostream>

namespace Ev {

int start(Io<int> main) {
	if (!ev_default_loop(0)) {
		std::cerr << "keybroker: libev failed to initialize"
			  << std::endl;
		return 255;
	}

	auto exit_code = 255;
	Detail::post([main, &exit_code]() {
		main.run([&exit_code](int code) {
			exit_code = code;
		}, [&exit_code](std::exception_ptr e) {
			exit_code = 254;
			try {
				std::rethrow_exception(e);
			} catch (std::exception const& err) {
				std::cerr << "keybroker: unhandled exception: "
					  << err.what()
					  << std::endl;
			} catch (...) {
				std::cerr << "keybroker: unhandled non-standard "
					     "exception"
					  << std::endl;
			}
		});
	});

	if (ev_run(EV_DEFAULT_ 0))
		std::cerr << "keybroker: WARNING: libev watchers "
			     "still active at exit"
			  << std::endl;

	return exit_code;
}

}
