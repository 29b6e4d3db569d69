#ifndef STREAMER_MOD_STREAMCONTROLLER_HPP
#define STREAMER_MOD_STREAMCONTROLLER_HPP

#include"Ev/now.hpp"
#include<cstddef>
#include<cstdint>
#include<functional>
#include<memory>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Ln { class Amount; }
namespace S { class Bus; }
namespace Streamer { class PaymentClient; }
namespace Streamer { struct StreamError; }
namespace Streamer { struct StreamPayment; }
namespace Streamer { class StreamRegistry; }
namespace Streamer { class StreamStore; }

namespace Streamer { namespace Mod {

/** class Streamer::Mod::StreamController
 *
 * @brief owns every status change of every stream
 * payment.
 *
 * @desc Prepares drafts, commits them, and starts,
 * pauses and finishes registered streams.
 * At most one stream is Streaming at a time:
 * starting one pauses all the others first.
 *
 * Listens for Streamer::Msg::DbResource to load
 * the persisted streams, and for
 * Streamer::Msg::PaymentBackend to learn the
 * payment client.
 * Raises Streamer::Msg::StreamError whenever a
 * stream is paused by a failure.
 *
 * State changes take effect in memory at once;
 * the returned action completes after they have
 * been written to the database, but failed writes
 * are only logged.
 *
 * Objects of this class are never moved; the tick
 * scheduler it owns refers back to it.
 */
class StreamController {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	StreamController() =delete;
	StreamController(StreamController&&) =delete;
	~StreamController();

	explicit
	StreamController( S::Bus& bus
			, std::function<double()> get_now = &Ev::now
			, double error_timeout = 30.0
			);

	/* Quotes the fee and makes the result the
	 * active draft.  */
	Ev::Io<StreamPayment> prepare( std::string const& counterparty
				     , Ln::Amount price
				     , std::uint64_t delay
				     , std::size_t total_parts
				     , std::string const& name
				     );
	Ev::Io<void> clear();
	/* Registers and persists the active draft as a
	 * paused stream.  */
	Ev::Io<StreamPayment> commit();

	/* All no-ops on unknown ids.  */
	Ev::Io<void> pause(std::string const& id);
	Ev::Io<void> pause_all();
	Ev::Io<void> start(std::string const& id);
	Ev::Io<void> finish(std::string const& id);

	/* Pauses the stream and reports the error.  */
	Ev::Io<void> handle_error( std::string const& id
				 , StreamError const& err
				 );

	std::vector<StreamPayment> list() const;
	/* Copy of the active draft, or nullptr.  */
	std::unique_ptr<StreamPayment> draft() const;

	StreamRegistry& registry();
	/* nullptr until provided.  */
	PaymentClient* client() const;
	StreamStore* store() const;
	/* Seconds a tick may wait on the remote side.  */
	double error_timeout() const;
};

}}

#endif /* !defined(STREAMER_MOD_STREAMCONTROLLER_HPP) */
