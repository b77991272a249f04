#include"Ledger/Error.hpp"
#include"Sqlite3/Error.hpp"
#include<sqlite3.h>

namespace Ledger {

char const* error_reason(Error e) {
	switch (e) {
	case Error_Ineligible: return "ineligible";
	case Error_AlreadyClaimedThisRound: return "already-claimed-this-round";
	case Error_PoolExhausted: return "pool-exhausted";
	case Error_TransactionFailed: return "transaction-failed";
	case Error_StorageUnavailable: return "storage-unavailable";
	case Error_InvariantViolation: return "invariant-violation";
	case Error_RoundRejected: return "round-rejected";
	case Error_InvalidSetting: return "invalid-setting";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& os, Error e) {
	return os << error_reason(e);
}

Error classify(Sqlite3::Error const& e) {
	switch (e.primary()) {
	case SQLITE_CANTOPEN:
	case SQLITE_IOERR:
	case SQLITE_FULL:
	case SQLITE_NOTADB:
	case SQLITE_CORRUPT:
	case SQLITE_READONLY:
	case SQLITE_PERM:
		return Error_StorageUnavailable;
	default:
		return Error_TransactionFailed;
	}
}

}
