#ifndef EV_MAP_HPP
#define EV_MAP_HPP

#include"Ev/Detail/run_queue.hpp"
#include"Ev/Io.hpp"
#include"Util/make_unique.hpp"
#include<cstddef>
#include<memory>
#include<type_traits>
#include<vector>

namespace Ev {

namespace Detail {

/* Collects the outcomes of the greenthreads started
 * by one Ev::map.  */
template<typename b>
struct Gather {
	std::vector<std::unique_ptr<b>> slots;
	std::exception_ptr first_error;
	std::size_t outstanding;
	std::function<void(std::vector<b>)> pass;
	FailFunc fail;

	void finished() {
		if (--outstanding != 0)
			return;
		if (first_error)
			return fail(first_error);
		auto rv = std::vector<b>();
		rv.reserve(slots.size());
		for (auto& s : slots)
			rv.push_back(std::move(*s));
		pass(std::move(rv));
	}
};

}

/** Ev::map
 *
 * @brief runs `func` on every item of `as`, each in
 * its own greenthread, and gathers the results in
 * input order.
 *
 * @desc The greenthreads overlap while they wait on
 * I/O or on each other (e.g. on a semaphore or a
 * database transaction).
 * All items run to completion even if some throw;
 * afterwards the first exception caught is rethrown.
 */
template<typename f, typename a>
Io<std::vector<typename Detail::IoInner<typename std::result_of<f(a)>::type>::type>>
map(f func, std::vector<a> as) {
	typedef typename Detail::IoInner<typename std::result_of<f(a)>::type>::type b;
	auto fn = std::make_shared<f>(std::move(func));
	auto args = std::make_shared<std::vector<a>>(std::move(as));

	return Io<std::vector<b>>([fn, args]( std::function<void(std::vector<b>)> pass
					    , Detail::FailFunc fail
					    ) {
		auto n = args->size();
		if (n == 0)
			return pass(std::vector<b>());

		auto g = std::make_shared<Detail::Gather<b>>();
		g->slots.resize(n);
		g->first_error = nullptr;
		g->outstanding = n;
		g->pass = std::move(pass);
		g->fail = std::move(fail);

		for (auto i = std::size_t(0); i < n; ++i) {
			Detail::post([fn, args, g, i]() {
				/* A throw from fn itself fails only this item.  */
				auto item = Ev::lift().then([fn, args, i]() {
					return (*fn)(std::move((*args)[i]));
				});
				item.run([g, i](b value) {
					g->slots[i] = Util::make_unique<b>(std::move(value));
					g->finished();
				}, [g](std::exception_ptr e) {
					if (!g->first_error)
						g->first_error = e;
					g->finished();
				});
			});
		}
	});
}

}

#endif /* !defined(EV_MAP_HPP) */
