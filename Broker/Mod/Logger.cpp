#include"Broker/Mod/Logger.hpp"
#include"Broker/Msg/Log.hpp"
#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include<algorithm>
#include<cctype>
#include<string>

namespace Broker { namespace Mod {

Logger::Logger( std::ostream& cerr_
	      , S::Bus& bus
	      , LogLevel threshold_
	      ) : cerr(cerr_), threshold(threshold_) {
	bus.subscribe<Msg::Log>([this](Msg::Log const& m) {
		if (m.level < threshold)
			return Ev::lift();
		auto level = std::string(log_level_name(m.level));
		std::transform( level.begin(), level.end(), level.begin()
			      , [](char c) { return char(std::toupper((unsigned char) c)); }
			      );
		cerr << "keybroker: " << level << " " << m.message
		     << std::endl;
		return Ev::lift();
	});
}

}}
