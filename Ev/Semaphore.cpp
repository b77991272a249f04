#include"Ev/Detail/run_queue.hpp"
#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Util/make_unique.hpp"
#include<deque>
#include<functional>
#include<stdexcept>
#include<utility>

namespace Ev {

class Semaphore::Impl {
public:
	std::size_t free_slots;
	/* Resumptions of greenthreads blocked in acquire,
	 * oldest first.  */
	std::deque<std::function<void()>> queue;

	explicit
	Impl(std::size_t slots) : free_slots(slots) { }
};

Semaphore::Semaphore(Semaphore&&) =default;
Semaphore::~Semaphore() =default;

Semaphore::Semaphore(std::size_t max)
	: pimpl(Util::make_unique<Impl>(max)) {
	if (max == 0)
		throw std::invalid_argument("Ev::Semaphore: no slots");
}

Ev::Io<void> Semaphore::acquire() {
	auto impl = pimpl.get();
	return Ev::Io<void>([impl]( std::function<void()> pass
				  , std::function<void(std::exception_ptr)>
				  ) {
		if (impl->free_slots == 0) {
			impl->queue.push_back(std::move(pass));
			return;
		}
		--impl->free_slots;
		pass();
	});
}

void Semaphore::release() {
	auto& queue = pimpl->queue;
	if (queue.empty()) {
		++pimpl->free_slots;
		return;
	}
	/* The slot goes straight to the oldest waiter.  */
	auto next = std::move(queue.front());
	queue.pop_front();
	Detail::post(std::move(next));
}

std::size_t Semaphore::waiting() const {
	return pimpl->queue.size();
}

}
