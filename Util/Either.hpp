#ifndef UTIL_EITHER_HPP
#define UTIL_EITHER_HPP

#include"Util/BacktraceException.hpp"
#include<new>
#include<stdexcept>
#include<utility>

namespace Util {

/** class Util::Either<L, R>
 *
 * @brief holds exactly one of an `L` or an `R`.
 *
 * @desc By convention `L` is the failure and `R`
 * the success value, so ledger operations return
 * `Either<Ledger::Error, T>`.
 *
 * Both types must be copyable.
 */
template<typename L, typename R>
class Either {
private:
	union U {
		L l;
		R r;
		U() { }
		~U() { }
	} u;
	bool holds_left;

	struct UnInit { };
	explicit Either(UnInit) { }

	void destroy() {
		if (holds_left)
			u.l.~L();
		else
			u.r.~R();
	}
	void construct_from(Either const& o) {
		holds_left = o.holds_left;
		if (holds_left)
			new(&u.l) L(o.u.l);
		else
			new(&u.r) R(o.u.r);
	}
	void construct_from(Either&& o) {
		holds_left = o.holds_left;
		if (holds_left)
			new(&u.l) L(std::move(o.u.l));
		else
			new(&u.r) R(std::move(o.u.r));
	}

public:
	static
	Either left(L obj) {
		Either rv((UnInit()));
		rv.holds_left = true;
		new(&rv.u.l) L(std::move(obj));
		return rv;
	}
	static
	Either right(R obj) {
		Either rv((UnInit()));
		rv.holds_left = false;
		new(&rv.u.r) R(std::move(obj));
		return rv;
	}

	Either() : holds_left(true) { new(&u.l) L(); }
	Either(Either const& o) { construct_from(o); }
	Either(Either&& o) { construct_from(std::move(o)); }
	~Either() { destroy(); }

	Either& operator=(Either const& o) {
		if (this == &o)
			return *this;
		destroy();
		construct_from(o);
		return *this;
	}
	Either& operator=(Either&& o) {
		if (this == &o)
			return *this;
		destroy();
		construct_from(std::move(o));
		return *this;
	}

	bool is_left() const { return holds_left; }
	bool is_right() const { return !holds_left; }

	/* Throw std::logic_error when the wrong side is asked for.  */
	L const& left() const {
		if (!holds_left)
			throw Util::BacktraceException<std::logic_error>(
				"Util::Either: left() of a right value"
			);
		return u.l;
	}
	R const& right() const {
		if (holds_left)
			throw Util::BacktraceException<std::logic_error>(
				"Util::Either: right() of a left value"
			);
		return u.r;
	}

	template<typename FL, typename FR>
	void match(FL fl, FR fr) const {
		if (holds_left)
			fl(u.l);
		else
			fr(u.r);
	}
};

template<typename L, typename R>
bool operator==(Util::Either<L,R> const& a, Util::Either<L,R> const& b) {
	if (a.is_left() != b.is_left())
		return false;
	if (a.is_left())
		return a.left() == b.left();
	return a.right() == b.right();
}
template<typename L, typename R>
bool operator!=(Util::Either<L,R> const& a, Util::Either<L,R> const& b) {
	return !(a == b);
}

}

#endif /* !defined(UTIL_EITHER_HPP) */
