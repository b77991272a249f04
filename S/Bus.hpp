#ifndef S_BUS_HPP
#define S_BUS_HPP

#include"S/Detail/Signal.hpp"
#include"Util/make_unique.hpp"
#include<cstddef>
#include<functional>
#include<memory>
#include<typeindex>
#include<typeinfo>

namespace S {

/** class S::Bus
 *
 * @brief typed publish/subscribe bus connecting the
 * modules of the process.
 *
 * @desc Modules subscribe to message types during
 * construction and raise messages while running.
 * Raising a message runs every subscriber in its own
 * greenthread and completes once all of them have
 * completed; if any subscriber throws, the raise
 * throws after the others finish.
 *
 * A message type with no subscribers is simply
 * dropped.
 */
class Bus {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Bus();
	Bus(Bus&&);
	~Bus();

private:
	/* Null if nobody asked for this type yet.  */
	S::Detail::SignalBase* find(std::type_index) const;
	S::Detail::SignalBase& add( std::type_index
				  , std::unique_ptr<S::Detail::SignalBase>
				  );

	template<typename a>
	S::Detail::Signal<a>& signal() {
		auto type = std::type_index(typeid(a));
		auto found = find(type);
		if (!found)
			found = &add(type, Util::make_unique<S::Detail::Signal<a>>());
		return static_cast<S::Detail::Signal<a>&>(*found);
	}

public:
	template<typename a>
	void subscribe(std::function<Ev::Io<void>(a const&)> cb) {
		signal<a>().subscribe(std::move(cb));
	}
	template<typename a>
	Ev::Io<void> raise(a value) {
		return signal<a>().raise(std::move(value));
	}
	/* Number of subscribers currently registered for `a`.  */
	template<typename a>
	std::size_t subscribers() {
		return signal<a>().size();
	}
};

}

#endif /* !defined(S_BUS_HPP) */
