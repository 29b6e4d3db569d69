#include"S/Bus.hpp"
#include<unordered_map>

namespace S {

class Bus::Impl {
public:
	std::unordered_map< std::type_index
			  , std::unique_ptr<Detail::SignalBase>
			  > signals;
};

Bus::Bus() : pimpl(Util::make_unique<Impl>()) { }
Bus::Bus(Bus&& o) : pimpl(std::move(o.pimpl)) { }
Bus::~Bus() { }

Detail::SignalBase&
Bus::signal_for(std::type_index type, Maker make) {
	auto it = pimpl->signals.find(type);
	if (it == pimpl->signals.end())
		it = pimpl->signals.emplace(type, make()).first;
	return *it->second;
}

}
