#include"Broker/Mod/Ingestor.hpp"
#include"Broker/ledger_call.hpp"
#include"Broker/log.hpp"
#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Ledger/Store.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"

namespace Broker { namespace Mod {

class Ingestor::Impl {
private:
	S::Bus& bus;
	Ledger::Store& store;

	typedef Util::Either<Ledger::Error, Ledger::IngestResult> OneResult;
	typedef Util::Either<Ledger::Error, std::size_t> SyncResult;

	struct SyncState {
		std::vector<std::string> candidates;
		std::size_t next;
		std::size_t inserted;
	};

	Ev::Io<SyncResult> sync_loop(std::shared_ptr<SyncState> st) {
		if (st->next >= st->candidates.size())
			return Ev::lift(SyncResult::right(st->inserted));

		auto const& key = st->candidates[st->next];
		++st->next;
		return ingest(key).then([this, st](OneResult r) {
			if (r.is_left())
				return Ev::lift(SyncResult::left(r.left()));
			if (r.right() == Ledger::Ingest_Inserted)
				++st->inserted;
			/* Let claims in between.  */
			return Ev::yield().then([this, st]() {
				return sync_loop(st);
			});
		});
	}

public:
	Impl(S::Bus& bus_, Ledger::Store& store_)
		: bus(bus_), store(store_) { }

	Ev::Io<OneResult> ingest(std::string const& key) {
		return ledger_call(bus, "Ingestor", store.transact<OneResult>([key](Sqlite3::Tx& tx) {
			auto rv = Ledger::Inventory::ingest(tx, key);
			tx.commit();
			return OneResult::right(rv);
		}));
	}

	Ev::Io<SyncResult> sync(std::vector<std::string> candidates) {
		auto st = std::make_shared<SyncState>();
		for (auto& c : candidates) {
			auto key = Util::Str::trim(c);
			if (!key.empty())
				st->candidates.push_back(std::move(key));
		}
		st->next = 0;
		st->inserted = 0;
		return sync_loop(st).then([this, st](SyncResult r) {
			if (r.is_left() || r.right() == 0)
				return Ev::lift(r);
			return Broker::log( bus, Info
					  , "Ingestor: %zu new keys out of %zu."
					  , r.right(), st->candidates.size()
					  ).then([r]() {
				return Ev::lift(r);
			});
		});
	}
};

Ingestor::Ingestor(S::Bus& bus, Ledger::Store& store)
	: pimpl(Util::make_unique<Impl>(bus, store)) { }
Ingestor::~Ingestor() { }

Ev::Io<Util::Either<Ledger::Error, Ledger::IngestResult>>
Ingestor::ingest(std::string const& key) {
	return pimpl->ingest(key);
}
Ev::Io<Util::Either<Ledger::Error, std::size_t>>
Ingestor::sync(std::vector<std::string> candidates) {
	return pimpl->sync(std::move(candidates));
}

}}
