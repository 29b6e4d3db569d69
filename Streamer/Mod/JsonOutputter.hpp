#ifndef STREAMER_MOD_JSONOUTPUTTER_HPP
#define STREAMER_MOD_JSONOUTPUTTER_HPP

#include<ostream>
#include<queue>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Streamer { namespace Mod {

/** class Streamer::Mod::JsonOutputter
 *
 * @brief writes each Streamer::Msg::JsonCout to
 * stdout, one datum per line, in the order they
 * were raised.
 */
class JsonOutputter {
private:
	std::ostream& cout;
	std::queue<std::string> outs;

	Ev::Io<void> drain();

public:
	JsonOutputter(std::ostream& cout, S::Bus& bus);
};

}}

#endif /* !defined(STREAMER_MOD_JSONOUTPUTTER_HPP) */
