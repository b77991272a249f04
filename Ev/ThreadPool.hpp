#ifndef EV_THREADPOOL_HPP
#define EV_THREADPOOL_HPP

#include"Ev/Io.hpp"
#include"Util/make_unique.hpp"
#include<cstddef>
#include<exception>
#include<functional>
#include<memory>

namespace Ev {

/** class Ev::ThreadPool
 *
 * @brief runs blocking calls (file and console reads)
 * on worker threads.
 *
 * @desc `background(func)` suspends the calling
 * greenthread while `func` runs on a worker, then
 * resumes it on the main loop with the result, or
 * with the exception `func` threw.
 * `func` must not touch greenthread state.
 *
 * An idle pool does not keep the loop running.
 * The destructor waits for running calls to return.
 */
class ThreadPool {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	/* `work` runs on a worker; `finish` runs on the
	 * main loop once `work` has returned.  */
	void submit(std::function<void()> work, std::function<void()> finish);

public:
	explicit
	ThreadPool(std::size_t workers = 2);
	~ThreadPool();
	ThreadPool(ThreadPool const&) =delete;
	ThreadPool(ThreadPool&&) =delete;

	template<typename a>
	Ev::Io<a> background(std::function<a()> func) {
		return Ev::Io<a>([this, func]( std::function<void(a)> pass
					     , std::function<void(std::exception_ptr)> fail
					     ) {
			auto value = std::make_shared<std::unique_ptr<a>>();
			auto error = std::make_shared<std::exception_ptr>();
			submit([func, value, error]() {
				try {
					*value = Util::make_unique<a>(func());
				} catch (...) {
					*error = std::current_exception();
				}
			}, [value, error, pass, fail]() {
				if (*error)
					return fail(*error);
				pass(std::move(**value));
			});
		});
	}
};

}

#endif /* !defined(EV_THREADPOOL_HPP) */
