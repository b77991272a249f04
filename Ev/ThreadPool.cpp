#include"Ev/ThreadPool.hpp"
#include<condition_variable>
#include<deque>
#include<ev.h>
#include<mutex>
#include<pthread.h>
#include<signal.h>
#include<thread>
#include<vector>

namespace Ev {

class ThreadPool::Impl {
private:
	struct Job {
		std::function<void()> work;
		std::function<void()> finish;
	};

	std::vector<std::thread> workers;
	/* Wakes the main loop when a job is done.  */
	ev_async done_signal;
	/* Jobs submitted but not yet finished.
	 * Main thread only.  */
	std::size_t outstanding;

	std::mutex mtx;
	std::condition_variable wake_worker;
	bool stopping;
	std::deque<Job> todo;
	std::deque<std::function<void()>> done;

	void work_loop() {
		auto lock = std::unique_lock<std::mutex>(mtx);
		for (;;) {
			wake_worker.wait(lock, [this]() {
				return stopping || !todo.empty();
			});
			if (stopping)
				return;
			auto job = std::move(todo.front());
			todo.pop_front();

			lock.unlock();
			job.work();
			lock.lock();

			done.emplace_back(std::move(job.finish));
			/* The loop exists: the job was submitted from it.  */
			ev_async_send(EV_DEFAULT_UC_ &done_signal);
		}
	}

	static
	void on_done(EV_P_ ev_async* w, int) {
		auto self = (Impl*) w->data;
		auto ready = std::deque<std::function<void()>>();
		{
			auto lock = std::unique_lock<std::mutex>(self->mtx);
			ready.swap(self->done);
		}
		self->outstanding -= ready.size();
		if (self->outstanding == 0)
			ev_async_stop(EV_A_ w);
		for (auto& finish : ready)
			finish();
	}

public:
	explicit
	Impl(std::size_t num_workers) : outstanding(0), stopping(false) {
		ev_async_init(&done_signal, &on_done);
		done_signal.data = this;

		/* Signals are for the main thread: workers
		 * start with every signal blocked.  */
		sigset_t all;
		sigset_t saved;
		sigfillset(&all);
		pthread_sigmask(SIG_SETMASK, &all, &saved);
		if (num_workers == 0)
			num_workers = 1;
		for (auto i = std::size_t(0); i < num_workers; ++i)
			workers.emplace_back([this]() { work_loop(); });
		pthread_sigmask(SIG_SETMASK, &saved, nullptr);
	}
	~Impl() {
		if (ev_is_active(&done_signal))
			ev_async_stop(EV_DEFAULT_ &done_signal);
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			stopping = true;
		}
		wake_worker.notify_all();
		for (auto& w : workers)
			w.join();
	}

	void submit(std::function<void()> work, std::function<void()> finish) {
		if (outstanding++ == 0)
			ev_async_start(EV_DEFAULT_ &done_signal);
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			todo.emplace_back(Job{std::move(work), std::move(finish)});
		}
		wake_worker.notify_one();
	}
};

ThreadPool::ThreadPool(std::size_t workers)
	: pimpl(Util::make_unique<Impl>(workers)) { }
ThreadPool::~ThreadPool() { }

void ThreadPool::submit( std::function<void()> work
		       , std::function<void()> finish
		       ) {
	pimpl->submit(std::move(work), std::move(finish));
}

}
