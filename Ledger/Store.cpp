#include"Ledger/Store.hpp"

namespace Ledger {

Store::Store( std::string const& filename
	    , std::size_t pool_size
	    , int busy_timeout_ms
	    ) : db(filename, busy_timeout_ms)
	      , pool(pool_size == 0 ? 1 : pool_size)
	      , size(pool_size == 0 ? 1 : pool_size)
	      { }

}
