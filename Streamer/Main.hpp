#ifndef STREAMER_MAIN_HPP
#define STREAMER_MAIN_HPP

#include<functional>
#include<istream>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Net { class Fd; }

namespace Streamer {

/** class Streamer::Main
 *
 * @brief the whole plugin: command-line handling,
 * module construction and the stdin loop.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() =delete;
	Main( std::vector<std::string> argv
	    , std::istream& cin
	    , std::ostream& cout
	    , std::ostream& cerr
	    , std::function< Net::Fd( std::string const&
				    , std::string const&
				    )
			   > open_rpc_socket
	    );
	Main(Main&&);
	~Main();

	/* Yields the process exit code.  */
	Ev::Io<int> run();
};

}

#endif /* !defined(STREAMER_MAIN_HPP) */
