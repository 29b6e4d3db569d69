#ifndef S_BUS_HPP
#define S_BUS_HPP

#include"S/Detail/Signal.hpp"
#include"Util/make_unique.hpp"
#include<functional>
#include<memory>
#include<typeindex>
#include<typeinfo>

namespace S {

/** class S::Bus
 *
 * @brief broadcasts typed messages to every
 * subscriber of that type.
 *
 * @desc Modules communicate only through the bus:
 * they `subscribe` to the message types they
 * handle, and `raise` the ones they produce.
 * The action returned by `raise` completes once
 * every subscriber's action has completed.
 */
class Bus {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	typedef std::function<std::unique_ptr<Detail::SignalBase>()> Maker;
	Detail::SignalBase& signal_for(std::type_index type, Maker make);

	template<typename a>
	Detail::Signal<a>& signal() {
		auto& base = signal_for(typeid(a), []() {
			return std::unique_ptr<Detail::SignalBase>(
				new Detail::Signal<a>()
			);
		});
		return static_cast<Detail::Signal<a>&>(base);
	}

public:
	Bus();
	Bus(Bus&&);
	~Bus();

	template<typename a>
	void subscribe(std::function<Ev::Io<void>(a const&)> cb) {
		signal<a>().subscribe(std::move(cb));
	}
	template<typename a>
	Ev::Io<void> raise(a value) {
		return signal<a>().raise(std::move(value));
	}
};

}

#endif /* !defined(S_BUS_HPP) */
