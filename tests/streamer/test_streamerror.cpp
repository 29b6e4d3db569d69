#undef NDEBUG
#include"Streamer/StreamError.hpp"
#include"Streamer/StreamPayment.hpp"
#include<assert.h>
#include<string>

int main() {
	using Streamer::error_code_name;

	assert(std::string(error_code_name(Streamer::Error_NoBackendConnection)) == "NoBackendConnection");
	assert(std::string(error_code_name(Streamer::Error_FeeQuote)) == "FeeQuoteError");
	assert(std::string(error_code_name(Streamer::Error_MissingDraft)) == "MissingDraft");
	assert(std::string(error_code_name(Streamer::Error_NotInStore)) == "NotInStore");
	assert(std::string(error_code_name(Streamer::Error_RemoteOffline)) == "RemoteOffline");
	assert(std::string(error_code_name(Streamer::Error_RemoteNotResponding)) == "RemoteNotResponding");

	/* Fixed text unless given.  */
	auto e = Streamer::StreamError(Streamer::Error_MissingDraft);
	assert(e.code == Streamer::Error_MissingDraft);
	assert(std::string(e.what()) != "");
	auto r = Streamer::StreamError(Streamer::Error_Remote, "no route");
	assert(std::string(r.what()) == "no route");

	assert(Streamer::is_remote_offline("Invalid JSON response from peer"));
	assert(Streamer::is_remote_offline("Timeout waiting for response"));
	assert(Streamer::is_remote_offline("Could not route or connect"));
	assert(!Streamer::is_remote_offline("Invoice expired"));
	assert(!Streamer::is_remote_offline(""));

	assert(std::string(Streamer::status_name(Streamer::Status_Streaming)) == "streaming");
	assert(std::string(Streamer::persisted_status(Streamer::Status_Prepared)) == "paused");
	assert(std::string(Streamer::persisted_status(Streamer::Status_Streaming)) == "running");
	assert(std::string(Streamer::persisted_status(Streamer::Status_Finished)) == "ended");
	assert(Streamer::status_from_persisted("running") == Streamer::Status_Streaming);
	assert(Streamer::status_from_persisted("ended") == Streamer::Status_Finished);
	assert(Streamer::status_from_persisted("paused") == Streamer::Status_Paused);
	assert(Streamer::status_from_persisted("garbage") == Streamer::Status_Paused);

	return 0;
}
