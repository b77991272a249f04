#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>

namespace Ev {

template<typename a>
class Io;

namespace Detail {

/* Given an Io<a>, extract the type a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<class Io<a>> {
	using type = a;
};

/* The success continuation for a given result type.  */
template<typename a>
struct PassFunc {
	using type = std::function<void(a)>;
};
template<>
struct PassFunc<void> {
	using type = std::function<void()>;
};

typedef std::function<void(std::exception_ptr)> FailFunc;

/* Common base of Io<a> and Io<void>.  */
template<typename a>
class IoBase {
public:
	typedef
	std::function<void ( typename Detail::PassFunc<a>::type
			   , FailFunc
			   )> CoreFunc;

protected:
	CoreFunc core;

	template <typename b>
	friend class Ev::Io;
	template <typename b>
	friend class IoBase;

public:
	IoBase(CoreFunc core_) : core(std::move(core_)) { }

	/** Ev::Io<a>::catching
	 *
	 * @brief if this action throws an exception of
	 * type `e`, run the handler action instead.
	 * Other exceptions propagate unchanged.
	 */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ]( typename Detail::PassFunc<a>::type pass
			      , FailFunc fail
			      ) {
			auto sub_fail = [ pass, fail
					, handler
					](std::exception_ptr err) {
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					handler(ex).core(pass, fail);
				} catch (...) {
					fail(std::current_exception());
				}
			};
			core_copy(pass, sub_fail);
		});
	}

	/* Runs the action.  Either continuation is
	 * invoked at most once, and thrown exceptions
	 * are routed to the fail continuation.
	 */
	void run( typename Detail::PassFunc<a>::type pass
		, FailFunc fail
		) const noexcept {
		auto completed = std::make_shared<bool>(false);
		auto sub_fail = [completed, fail](std::exception_ptr e) {
			if (!*completed) {
				*completed = true;
				fail(std::move(e));
			}
		};
		try {
			RunPass<a>::run(core, completed, std::move(pass), sub_fail);
		} catch (...) {
			sub_fail(std::current_exception());
		}
	}

private:
	template<typename b, typename dummy = void>
	struct RunPass {
		static void run( CoreFunc const& core
			       , std::shared_ptr<bool> completed
			       , typename Detail::PassFunc<b>::type pass
			       , FailFunc fail
			       ) {
			core([completed, pass](b value) {
				if (!*completed) {
					*completed = true;
					pass(std::move(value));
				}
			}, std::move(fail));
		}
	};
	template<typename dummy>
	struct RunPass<void, dummy> {
		static void run( CoreFunc const& core
			       , std::shared_ptr<bool> completed
			       , std::function<void()> pass
			       , FailFunc fail
			       ) {
			core([completed, pass]() {
				if (!*completed) {
					*completed = true;
					pass();
				}
			}, std::move(fail));
		}
	};
};

}

template<typename a>
class Io : public Detail::IoBase<a> {
public:
	Io(typename Detail::IoBase<a>::CoreFunc core_)
		: Detail::IoBase<a>(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f(a)>::type>::type>
	then(f func) const {
		using b = typename Detail::IoInner<typename std::result_of<f(a)>::type>::type;
		auto core_copy = this->core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			try {
				auto sub_pass = [func, pass, fail](a value) {
					try {
						func(std::move(value)).core(pass, fail);
					} catch (...) {
						fail(std::current_exception());
					}
				};
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}
};

template<>
class Io<void> : public Detail::IoBase<void> {
public:
	Io(typename Detail::IoBase<void>::CoreFunc core_)
		: Detail::IoBase<void>(std::move(core_)) { }

	/* (>>=) :: IO () -> (() -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f()>::type>::type>
	then(f func) const {
		using b = typename Detail::IoInner<typename std::result_of<f()>::type>::type;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			try {
				auto sub_pass = [func, pass, fail]() {
					try {
						func().core(pass, fail);
					} catch (...) {
						fail(std::current_exception());
					}
				};
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}
};

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, Detail::FailFunc
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , Detail::FailFunc
			  ) {
		pass();
	});
}

/* (>>) :: IO () -> IO b -> IO b */
template<typename b>
Io<b> operator+(Io<void> first, Io<b> second) {
	auto psecond = std::make_shared<Io<b>>(std::move(second));
	return first.then([psecond]() {
		return *psecond;
	});
}
inline
Io<void>& operator+=(Io<void>& first, Io<void> second) {
	first = std::move(first) + std::move(second);
	return first;
}

}

#endif /* !defined(EV_IO_HPP) */
