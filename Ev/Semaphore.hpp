#ifndef EV_SEMAPHORE_HPP
#define EV_SEMAPHORE_HPP

#include"Ev/Io.hpp"
#include<cstddef>
#include<functional>
#include<memory>
#include<utility>

namespace Ev {

namespace Detail {

/* Calls `after` once `io` finishes, whichever way
 * it finishes, then continues as `io` did.  */
template<typename a>
struct ThenAlways {
	static
	Ev::Io<a> wrap(Ev::Io<a> io, std::function<void()> after) {
		return Ev::Io<a>([io, after]( std::function<void(a)> pass
					    , FailFunc fail
					    ) {
			io.run([after, pass](a value) {
				after();
				pass(std::move(value));
			}, [after, fail](std::exception_ptr e) {
				after();
				fail(e);
			});
		});
	}
};
template<>
struct ThenAlways<void> {
	static
	Ev::Io<void> wrap(Ev::Io<void> io, std::function<void()> after) {
		return Ev::Io<void>([io, after]( std::function<void()> pass
					       , FailFunc fail
					       ) {
			io.run([after, pass]() {
				after();
				pass();
			}, [after, fail](std::exception_ptr e) {
				after();
				fail(e);
			});
		});
	}
};

}

/** class Ev::Semaphore
 *
 * @brief lets at most a fixed number of actions
 * run at the same time; further actions wait in
 * FIFO order until a running one completes or
 * throws.
 */
class Semaphore {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	/* Completes once this greenthread owns a slot.  */
	Ev::Io<void> acquire();
	void release();

public:
	Semaphore() =delete;
	Semaphore(Semaphore const&) =delete;

	Semaphore(Semaphore&& o);
	~Semaphore();
	explicit
	Semaphore(std::size_t max);

	/** Ev::Semaphore::run
	 *
	 * @brief executes the action once a slot is
	 * free.
	 *
	 * @desc If the action throws, the slot is
	 * released and the exception propagates.
	 * A waiting action resumes from the loop, not
	 * from inside the one that released its slot.
	 */
	template<typename a>
	Ev::Io<a> run(Ev::Io<a> action) {
		auto self = this;
		return acquire().then([self, action]() {
			return Detail::ThenAlways<a>::wrap(action, [self]() {
				self->release();
			});
		});
	}

	/* Number of actions waiting for a slot.  */
	std::size_t waiting() const;
};

}

#endif /* !defined(EV_SEMAPHORE_HPP) */
