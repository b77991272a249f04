#ifndef BROKER_MOD_CLAIMER_HPP
#define BROKER_MOD_CLAIMER_HPP

#include"Ledger/Error.hpp"
#include"Util/Either.hpp"
#include<cstdint>
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Ledger { class Store; }
namespace S { class Bus; }

namespace Broker { namespace Mod {

/** class Broker::Mod::Claimer
 *
 * @brief hands out keys.
 *
 * @desc A claim registers the user, picks a key and
 * binds it to the user and the active round, all in
 * one transaction, so no two claims can ever get the
 * same key and a failed claim leaves no trace.
 */
class Claimer {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Claimer() =delete;
	Claimer(Claimer const&) =delete;

	Claimer(S::Bus& bus, Ledger::Store& store);
	~Claimer();

	typedef Util::Either<Ledger::Error, std::string> Result;

	/** Broker::Mod::Claimer::claim
	 *
	 * @brief gives `user` a key, at most one per
	 * active round.
	 *
	 * @desc Fails with `Error_AlreadyClaimedThisRound`
	 * if the user already holds a key from the active
	 * round while keys remain, `Error_PoolExhausted`
	 * if no key remains, `Error_Ineligible` for an
	 * empty user name.
	 */
	Ev::Io<Result> claim(std::string const& user);

	/** Broker::Mod::Claimer::claim_unchecked
	 *
	 * @brief administrator grant: like `claim` but
	 * without the once-per-round limit.  The key is
	 * still recorded against the active round.
	 */
	Ev::Io<Result> claim_unchecked(std::string const& user);

	Ev::Io<Util::Either<Ledger::Error, std::int64_t>> count_unclaimed();
};

}}

#endif /* !defined(BROKER_MOD_CLAIMER_HPP) */
