#undef NDEBUG
#include"Util/Either.hpp"
#include<assert.h>
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace {

enum Fault { Fault_None, Fault_Busy, Fault_Gone };

typedef Util::Either<Fault, std::string> Lookup;
typedef Util::Either<std::string, std::vector<std::int64_t>> Batch;

}

int main() {
	/* Default holds a default left.  */
	{
		auto e = Lookup();
		assert(e.is_left());
		assert(e.left() == Fault_None);
	}

	/* Construction and accessors.  */
	{
		auto l = Lookup::left(Fault_Busy);
		assert(l.is_left());
		assert(!l.is_right());
		assert(l.left() == Fault_Busy);

		auto r = Lookup::right("KEY-1");
		assert(r.is_right());
		assert(r.right() == "KEY-1");

		/* Asking for the wrong side is a bug.  */
		auto threw = false;
		try {
			(void) l.right();
		} catch (std::logic_error const&) {
			threw = true;
		}
		assert(threw);
		threw = false;
		try {
			(void) r.left();
		} catch (std::logic_error const&) {
			threw = true;
		}
		assert(threw);
	}

	/* Copy, move and assignment across sides.  */
	{
		auto a = Batch::right(std::vector<std::int64_t>{1, 2, 3});
		auto b = a;
		assert(b.right().size() == 3);
		auto c = std::move(b);
		assert(c.right()[2] == 3);

		auto d = Batch::left("too many");
		d = a;
		assert(d.is_right());
		assert(d == a);
		d = Batch::left("again");
		assert(d.is_left());
		assert(d.left() == "again");
	}

	/* Equality.  */
	{
		assert(Lookup::left(Fault_Gone) == Lookup::left(Fault_Gone));
		assert(Lookup::left(Fault_Gone) != Lookup::left(Fault_Busy));
		assert(Lookup::right("x") == Lookup::right("x"));
		assert(Lookup::right("x") != Lookup::right("y"));
		assert(Lookup::left(Fault_None) != Lookup::right(""));
	}

	/* Matching.  */
	{
		auto seen = std::string();
		Lookup::right("KEY-2").match([&](Fault) {
			seen = "fault";
		}, [&](std::string const& k) {
			seen = k;
		});
		assert(seen == "KEY-2");
		Lookup::left(Fault_Gone).match([&](Fault f) {
			seen = f == Fault_Gone ? "gone" : "other";
		}, [&](std::string const&) {
			seen = "key";
		});
		assert(seen == "gone");
	}

	return 0;
}
