#ifndef STREAMER_STREAMPAYMENT_HPP
#define STREAMER_STREAMPAYMENT_HPP

#include"Ln/Amount.hpp"
#include<cstddef>
#include<cstdint>
#include<string>

namespace Json { class Out; }

namespace Streamer {

enum StreamStatus {
	/* Draft, not yet persisted.  */
	Status_Prepared,
	Status_Paused,
	Status_Streaming,
	/* Terminal.  */
	Status_Finished
};

/* "prepared", "paused", "streaming", "finished".  */
char const* status_name(StreamStatus);

/* The three values stored in the database:
 * "paused" (also for drafts), "running" and "ended".  */
char const* persisted_status(StreamStatus);
/* Unknown strings load as Paused.  */
StreamStatus status_from_persisted(std::string const&);

/** struct Streamer::StreamPayment
 *
 * @brief one large payment split into `total_parts`
 * equal parts of `price`, paid to `counterparty`
 * one every `delay` milliseconds.
 */
struct StreamPayment {
	std::string id;
	std::string counterparty;
	Ln::Amount price;
	std::uint64_t delay;
	std::size_t total_parts;
	std::size_t parts_paid;
	/* Parts whose invoice has been fetched but whose
	 * payment has not resolved.  Never persisted.  */
	std::size_t parts_requested;
	/* Routing fee quoted for one part.  */
	Ln::Amount fee;
	std::string memo;
	std::string name;
	/* Seconds since the epoch.  */
	double created_at;
	StreamStatus status;
};

/* Object form used in command results.  */
Json::Out stream_to_json(StreamPayment const&);

}

#endif /* !defined(STREAMER_STREAMPAYMENT_HPP) */
