#ifndef STREAMER_JSONINPUT_HPP
#define STREAMER_JSONINPUT_HPP

#include<istream>
#include<memory>

namespace Ev { template<typename a> class Io; }
namespace Ev { class ThreadPool; }
namespace S { class Bus; }

namespace Streamer {

/** class Streamer::JsonInput
 *
 * @brief reads JSON from stdin and raises a
 * Streamer::Msg::JsonCin for each complete datum.
 *
 * @desc Unlike the modules, this has a `run`
 * action, which completes when stdin reaches
 * end-of-file; the plugin then shuts down.
 * Reads block, so they are done on the thread
 * pool; parsing happens on the main loop.
 */
class JsonInput {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	JsonInput( Ev::ThreadPool& threadpool
		 , std::istream& cin
		 , S::Bus& bus
		 );
	JsonInput(JsonInput&&);
	~JsonInput();

	Ev::Io<void> run();
};

}

#endif /* !defined(STREAMER_JSONINPUT_HPP) */
