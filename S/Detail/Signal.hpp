#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"S/Detail/SignalBase.hpp"
#include<cstddef>
#include<functional>
#include<memory>
#include<vector>

namespace S { namespace Detail {

/* Subscriber list for a single message type.  */
template<typename a>
class Signal : public SignalBase {
private:
	typedef std::function<Ev::Io<void>(a const&)> Callback;
	/* Shared so that a raise in progress keeps the list it
	 * started with even if someone subscribes meanwhile.  */
	std::shared_ptr<std::vector<Callback>> callbacks;

	/* State of a single raise.  */
	struct Raising {
		a value;
		std::shared_ptr<std::vector<Callback>> callbacks;
		std::size_t running;
		bool launching;
		std::exception_ptr exc;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;

		Raising( a value_
		       , std::shared_ptr<std::vector<Callback>> callbacks_
		       ) : value(std::move(value_))
			 , callbacks(std::move(callbacks_))
			 , running(0)
			 , launching(true)
			 , exc(nullptr)
			 { }

		void check_done() {
			if (launching || running != 0 || !pass)
				return;
			auto my_pass = std::move(pass);
			auto my_fail = std::move(fail);
			pass = nullptr;
			fail = nullptr;
			if (exc)
				my_fail(exc);
			else
				my_pass();
		}
	};

	static
	Ev::Io<void> launch(std::shared_ptr<Raising> r, std::size_t i) {
		if (i >= r->callbacks->size()) {
			r->launching = false;
			return Ev::lift();
		}
		++r->running;
		auto body = Ev::Io<void>([r, i]( std::function<void()> pass
					       , std::function<void(std::exception_ptr)>
					       ) {
			auto done = [r, pass]() {
				pass();
				--r->running;
				r->check_done();
			};
			(*r->callbacks)[i](r->value).run(done
							, [r, done](std::exception_ptr e) {
				r->exc = e;
				done();
			});
		});
		return Ev::concurrent(body) + Ev::yield().then([r, i]() {
			return launch(r, i + 1);
		});
	}
	static
	Ev::Io<void> wait(std::shared_ptr<Raising> r) {
		return Ev::Io<void>([r]( std::function<void()> pass
				       , std::function<void(std::exception_ptr)> fail
				       ) {
			r->pass = std::move(pass);
			r->fail = std::move(fail);
			r->check_done();
		});
	}

public:
	Signal() : callbacks(std::make_shared<std::vector<Callback>>()) { }

	void subscribe(Callback cb) {
		if (!cb)
			return;
		auto ncallbacks = std::make_shared<std::vector<Callback>>(*callbacks);
		ncallbacks->push_back(std::move(cb));
		callbacks = std::move(ncallbacks);
	}

	std::size_t size() const { return callbacks->size(); }

	Ev::Io<void> raise(a value) {
		auto r = std::make_shared<Raising>(std::move(value), callbacks);
		return Ev::yield().then([r]() {
			return launch(r, 0);
		}).then([r]() {
			return wait(r);
		});
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
