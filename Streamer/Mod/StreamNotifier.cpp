#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Streamer/Mod/StreamNotifier.hpp"
#include"Streamer/Msg/JsonCout.hpp"
#include"Streamer/Msg/ManifestCustomNotification.hpp"
#include"Streamer/Msg/Manifestation.hpp"
#include"Streamer/Msg/StreamError.hpp"
#include"Streamer/Msg/StreamProgress.hpp"
#include"Streamer/log.hpp"

namespace {

auto const progress_topic = "streamer_progress";
auto const error_topic = "streamer_error";

Json::Out notification(char const* method, Json::Out params) {
	return Json::Out()
		.start_object()
			.field("jsonrpc", std::string("2.0"))
			.field("method", std::string(method))
			.field("params", params)
		.end_object()
		;
}

}

namespace Streamer { namespace Mod {

void StreamNotifier::start() {
	bus.subscribe<Msg::Manifestation
		     >([this](Msg::Manifestation const&) {
		return bus.raise(Msg::ManifestCustomNotification{
			progress_topic
		}) + bus.raise(Msg::ManifestCustomNotification{
			error_topic
		});
	});

	bus.subscribe<Msg::StreamProgress
		     >([this](Msg::StreamProgress const& m) {
		auto params = Json::Out()
			.start_object()
				.field("stream_id", m.stream_id)
				.field("parts_paid", m.parts_paid)
				.field("total_parts", m.total_parts)
			.end_object()
			;
		return Streamer::log( bus, Info
				    , "Stream %s: %zu of %zu parts paid."
				    , m.stream_id.c_str()
				    , m.parts_paid, m.total_parts
				    )
		     + bus.raise(Msg::JsonCout{
				notification(progress_topic, params)
		       });
	});
	bus.subscribe<Msg::StreamError
		     >([this](Msg::StreamError const& m) {
		auto params = Json::Out()
			.start_object()
				.field("category", m.category)
				.field("stream_id", m.stream_id)
				.field("error", m.error)
				.field("message", m.message)
			.end_object()
			;
		return Streamer::log( bus, Error
				    , "Stream %s paused: %s"
				    , m.stream_id.c_str()
				    , m.message.c_str()
				    )
		     + bus.raise(Msg::JsonCout{
				notification(error_topic, params)
		       });
	});
}

}}
