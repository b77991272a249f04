#include"Ev/Detail/run_queue.hpp"
#include<deque>
#include<ev.h>
#include<utility>

namespace {

struct RunQueue {
	ev_idle idler;
	bool initialized;
	std::deque<std::function<void()>> steps;
};

RunQueue& the_queue() {
	static RunQueue q = RunQueue{ ev_idle(), false, {} };
	return q;
}

void drain(EV_P_ ev_idle* w, int) {
	auto& q = the_queue();
	/* Only what was queued before this pass.  */
	auto batch = std::deque<std::function<void()>>();
	batch.swap(q.steps);
	ev_idle_stop(EV_A_ w);

	while (!batch.empty()) {
		auto step = std::move(batch.front());
		batch.pop_front();
		step();
	}
}

}

namespace Ev { namespace Detail {

void post(std::function<void()> step) {
	auto& q = the_queue();
	if (!q.initialized) {
		ev_idle_init(&q.idler, &drain);
		q.initialized = true;
	}
	q.steps.emplace_back(std::move(step));
	if (!ev_is_active(&q.idler))
		ev_idle_start(EV_DEFAULT_ &q.idler);
}

}}
