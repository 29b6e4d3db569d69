#include"Streamer/StreamError.hpp"
#include"Util/Str.hpp"

namespace {

char const* default_message(Streamer::StreamErrorCode c) {
	switch (c) {
	case Streamer::Error_NoBackendConnection:
		return "Payment backend is not connected.";
	case Streamer::Error_FeeQuote:
		return "Could not get a fee quote for the counterparty.";
	case Streamer::Error_MissingDraft:
		return "No stream payment has been prepared.";
	case Streamer::Error_NotInStore:
		return "Stream payment not found.";
	case Streamer::Error_RemoteOffline:
		return "Counterparty is offline.";
	case Streamer::Error_RemoteNotResponding:
		return "Payment backend is not responding.";
	case Streamer::Error_Remote:
		return "Payment failed.";
	}
	return "Stream payment error.";
}

char const* const offline_patterns[] = {
	"invalid json response",
	"timeout waiting for response",
	"could not route or connect"
};

}

namespace Streamer {

char const* error_code_name(StreamErrorCode c) {
	switch (c) {
	case Error_NoBackendConnection: return "NoBackendConnection";
	case Error_FeeQuote: return "FeeQuoteError";
	case Error_MissingDraft: return "MissingDraft";
	case Error_NotInStore: return "NotInStore";
	case Error_RemoteOffline: return "RemoteOffline";
	case Error_RemoteNotResponding: return "RemoteNotResponding";
	case Error_Remote: return "RemoteError";
	}
	return "RemoteError";
}

StreamError::StreamError(StreamErrorCode code_)
	: std::runtime_error(default_message(code_)), code(code_) { }

bool is_remote_offline(std::string const& error_text) {
	auto text = Util::Str::lowercase(error_text);
	for (auto p : offline_patterns)
		if (text.find(p) != std::string::npos)
			return true;
	return false;
}

}
