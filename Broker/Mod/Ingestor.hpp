#ifndef BROKER_MOD_INGESTOR_HPP
#define BROKER_MOD_INGESTOR_HPP

#include"Ledger/Error.hpp"
#include"Ledger/Inventory.hpp"
#include"Util/Either.hpp"
#include<cstddef>
#include<memory>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Ledger { class Store; }
namespace S { class Bus; }

namespace Broker { namespace Mod {

/** class Broker::Mod::Ingestor
 *
 * @brief adds externally supplied keys to the
 * inventory.
 */
class Ingestor {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Ingestor() =delete;
	Ingestor(Ingestor const&) =delete;

	Ingestor(S::Bus& bus, Ledger::Store& store);
	~Ingestor();

	/* Adds one key unless it is already known.  */
	Ev::Io<Util::Either<Ledger::Error, Ledger::IngestResult>>
	ingest(std::string const& key);

	/** Broker::Mod::Ingestor::sync
	 *
	 * @brief ingests every candidate, each in its own
	 * transaction, and returns how many were new.
	 *
	 * @desc Running it again with the same list adds
	 * nothing.  Keys missing from the list are never
	 * removed.  Candidates are trimmed first, and
	 * those left empty are skipped.
	 * Stops at the first failure and returns it; the
	 * keys ingested before the failure stay.
	 */
	Ev::Io<Util::Either<Ledger::Error, std::size_t>>
	sync(std::vector<std::string> candidates);
};

}}

#endif /* !defined(BROKER_MOD_INGESTOR_HPP) */
