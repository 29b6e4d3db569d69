#ifndef STREAMER_STREAMREGISTRY_HPP
#define STREAMER_STREAMREGISTRY_HPP

#include"Streamer/StreamPayment.hpp"
#include"Streamer/StreamTimers.hpp"
#include<cstdint>
#include<map>
#include<memory>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Streamer { class StreamStore; }

namespace Streamer {

/** class Streamer::StreamRegistry
 *
 * @brief the live streams, keyed by id, newest
 * first.
 *
 * @desc Entries are heap-allocated and never
 * move, so an `Entry*` stays valid until the
 * entry is erased or the registry reloaded.
 * Do not hold one across a suspension point;
 * look the id up again instead.
 */
class StreamRegistry {
public:
	struct Entry {
		StreamPayment payment;
		StreamTimers timers;
		/* Bumped whenever the stream is started,
		 * paused or finished.  A remote call whose
		 * epoch is stale on return is ignored.  */
		std::uint64_t epoch;
		/* Set while an invoice request of the current
		 * epoch is outstanding.  */
		bool invoice_pending;
	};

private:
	std::map<std::string, std::unique_ptr<Entry>> entries;
	std::vector<std::string> order;

public:
	/* Replaces the contents with the unfinished
	 * streams in the store.  Streams the store says
	 * were running are loaded as paused.  */
	Ev::Io<void> load(StreamStore& store);

	/* nullptr if unknown.  */
	Entry* get(std::string const& id);
	Entry const* get(std::string const& id) const;

	/* Adds a new stream, or replaces the payment of
	 * an existing one, keeping its timers and
	 * epoch.  */
	Entry& upsert(StreamPayment const& payment);

	/* Ids of streams currently Streaming.  */
	std::vector<std::string> streaming() const;
	std::vector<StreamPayment> all() const;
	std::size_t size() const { return order.size(); }

	void cancel_all_timers();
};

}

#endif /* !defined(STREAMER_STREAMREGISTRY_HPP) */
