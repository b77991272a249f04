#include"S/Bus.hpp"
#include<map>

namespace S {

class Bus::Impl {
public:
	std::map< std::type_index
		, std::unique_ptr<S::Detail::SignalBase>
		> by_type;
};

Bus::Bus() : pimpl(Util::make_unique<Impl>()) { }
Bus::Bus(Bus&&) =default;
Bus::~Bus() =default;

S::Detail::SignalBase* Bus::find(std::type_index type) const {
	auto it = pimpl->by_type.find(type);
	if (it == pimpl->by_type.end())
		return nullptr;
	return it->second.get();
}

S::Detail::SignalBase&
Bus::add( std::type_index type
	, std::unique_ptr<S::Detail::SignalBase> signal
	) {
	auto& slot = pimpl->by_type[type];
	slot = std::move(signal);
	return *slot;
}

}
