#ifndef BROKER_LEDGER_CALL_HPP
#define BROKER_LEDGER_CALL_HPP

#include"Broker/log.hpp"
#include"Ev/Io.hpp"
#include"Ledger/Error.hpp"
#include"Sqlite3/Error.hpp"
#include"Util/Either.hpp"

namespace S { class Bus; }

namespace Broker {

/** Broker::ledger_call
 *
 * @brief runs a ledger action and turns the
 * exceptions it may throw into `Ledger::Error`
 * values, logging each under the name `who`.
 *
 * @desc `Sqlite3::Error` becomes
 * `Error_StorageUnavailable` (logged as an error)
 * or `Error_TransactionFailed` (logged as a
 * warning).
 * `Ledger::InvariantViolation` becomes
 * `Error_InvariantViolation` (logged as an error).
 * Any other exception propagates.
 */
template<typename a>
Ev::Io<Util::Either<Ledger::Error, a>>
ledger_call( S::Bus& bus
	   , char const* who
	   , Ev::Io<Util::Either<Ledger::Error, a>> action
	   ) {
	typedef Util::Either<Ledger::Error, a> Result;
	auto pbus = &bus;
	return action.template catching<Sqlite3::Error>([pbus, who](Sqlite3::Error const& e) {
		auto code = Ledger::classify(e);
		auto level = (code == Ledger::Error_StorageUnavailable) ? Error : Warn;
		return Broker::log( *pbus, level
				  , "%s: %s: %s"
				  , who, Ledger::error_reason(code), e.what()
				  ).then([code]() {
			return Ev::lift(Result::left(code));
		});
	}).template catching<Ledger::InvariantViolation>([pbus, who](Ledger::InvariantViolation const& e) {
		return Broker::log( *pbus, Error
				  , "%s: %s"
				  , who, e.what()
				  ).then([]() {
			return Ev::lift(Result::left(Ledger::Error_InvariantViolation));
		});
	});
}

}

#endif /* !defined(BROKER_LEDGER_CALL_HPP) */
