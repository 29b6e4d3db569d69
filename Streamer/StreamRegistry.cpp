#include"Ev/Io.hpp"
#include"Streamer/StreamRegistry.hpp"
#include"Streamer/StreamStore.hpp"
#include"Util/make_unique.hpp"

namespace Streamer {

Ev::Io<void> StreamRegistry::load(StreamStore& store) {
	return store.list_streams().then([this](std::vector<StreamPayment> streams) {
		cancel_all_timers();
		entries.clear();
		order.clear();
		/* Already newest first.  */
		for (auto& p : streams) {
			if (p.status == Status_Finished)
				continue;
			if (p.status == Status_Streaming)
				p.status = Status_Paused;
			p.parts_requested = 0;
			auto id = p.id;
			auto entry = Util::make_unique<Entry>();
			entry->payment = std::move(p);
			entry->epoch = 0;
			entry->invoice_pending = false;
			entries[id] = std::move(entry);
			order.push_back(std::move(id));
		}
		return Ev::lift();
	});
}

StreamRegistry::Entry* StreamRegistry::get(std::string const& id) {
	auto it = entries.find(id);
	if (it == entries.end())
		return nullptr;
	return it->second.get();
}
StreamRegistry::Entry const*
StreamRegistry::get(std::string const& id) const {
	auto it = entries.find(id);
	if (it == entries.end())
		return nullptr;
	return it->second.get();
}

StreamRegistry::Entry& StreamRegistry::upsert(StreamPayment const& payment) {
	auto it = entries.find(payment.id);
	if (it != entries.end()) {
		it->second->payment = payment;
		return *it->second;
	}
	auto entry = Util::make_unique<Entry>();
	entry->payment = payment;
	entry->epoch = 0;
	entry->invoice_pending = false;
	auto& ret = *entry;
	entries[payment.id] = std::move(entry);
	order.insert(order.begin(), payment.id);
	return ret;
}

std::vector<std::string> StreamRegistry::streaming() const {
	auto ret = std::vector<std::string>();
	for (auto const& id : order)
		if (entries.at(id)->payment.status == Status_Streaming)
			ret.push_back(id);
	return ret;
}

std::vector<StreamPayment> StreamRegistry::all() const {
	auto ret = std::vector<StreamPayment>();
	for (auto const& id : order)
		ret.push_back(entries.at(id)->payment);
	return ret;
}

void StreamRegistry::cancel_all_timers() {
	for (auto& e : entries)
		e.second->timers.cancel_all();
}

}
