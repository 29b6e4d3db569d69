#include"Json/Out.hpp"
#include"Streamer/StreamPayment.hpp"

namespace Streamer {

char const* status_name(StreamStatus s) {
	switch (s) {
	case Status_Prepared: return "prepared";
	case Status_Paused: return "paused";
	case Status_Streaming: return "streaming";
	case Status_Finished: return "finished";
	}
	return "paused";
}

char const* persisted_status(StreamStatus s) {
	switch (s) {
	case Status_Prepared:
	case Status_Paused:
		return "paused";
	case Status_Streaming:
		return "running";
	case Status_Finished:
		return "ended";
	}
	return "paused";
}

StreamStatus status_from_persisted(std::string const& s) {
	if (s == "running")
		return Status_Streaming;
	if (s == "ended")
		return Status_Finished;
	return Status_Paused;
}

Json::Out stream_to_json(StreamPayment const& p) {
	return Json::Out()
		.start_object()
			.field("id", p.id)
			.field("counterparty", p.counterparty)
			.field("name", p.name)
			.field("memo", p.memo)
			.field("price_msat", p.price.to_msat())
			.field("fee_msat", p.fee.to_msat())
			.field("delay_ms", p.delay)
			.field("total_parts", p.total_parts)
			.field("parts_paid", p.parts_paid)
			.field("created_at", p.created_at)
			.field("status", std::string(status_name(p.status)))
		.end_object()
		;
}

}
