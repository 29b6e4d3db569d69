#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/yield.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Streamer/JsonInput.hpp"
#include"Streamer/Main.hpp"
#include"Streamer/Mod/all.hpp"
#include"Streamer/Msg/Begin.hpp"
#include"Streamer/Shutdown.hpp"
#include"Util/make_unique.hpp"

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#ifndef PACKAGE_STRING
# define PACKAGE_STRING "clstreamer"
#endif
#ifndef PACKAGE_BUGREPORT
# define PACKAGE_BUGREPORT "the clstreamer maintainers"
#endif

/* Where exception backtraces find the symbols.  */
std::string g_argv0;

namespace Streamer {

class Main::Impl {
private:
	std::istream& cin;
	std::ostream& cout;
	std::ostream& cerr;
	std::function< Net::Fd( std::string const&
			      , std::string const&
			      )
		     > open_rpc_socket;

	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<Ev::ThreadPool> threadpool;
	std::unique_ptr<JsonInput> jsoninput;
	std::shared_ptr<void> modules;

	std::string argv0;
	bool is_version;
	bool is_help;
	int exit_code;

	void usage() {
		cout << "Usage: add --plugin=" << argv0
		     << " to your lightningd command line or configuration file"
		     << std::endl
		     << std::endl
		     << "Options:" << std::endl
		     << " --version, -V      Show version." << std::endl
		     << " --help, -h         Show this help." << std::endl
		     << std::endl
		     << "Plugin commands:" << std::endl
		     << " streamer-prepare, streamer-commit, streamer-clear," << std::endl
		     << " streamer-start, streamer-pause, streamer-finish," << std::endl
		     << " streamer-list" << std::endl
		     << std::endl
		     << "Send bug reports to: " << PACKAGE_BUGREPORT << std::endl
		     ;
	}

public:
	Impl( std::vector<std::string> argv
	    , std::istream& cin_
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    , std::function< Net::Fd( std::string const&
				    , std::string const&
				    )
			   > open_rpc_socket_
	    ) : cin(cin_)
	      , cout(cout_)
	      , cerr(cerr_)
	      , open_rpc_socket(std::move(open_rpc_socket_))
	      , argv0(argv.empty() ? "clstreamer" : argv[0])
	      , is_version(false)
	      , is_help(false)
	      , exit_code(0)
	      {
		g_argv0 = argv0;
		if (argv.size() < 2)
			return;
		auto const& arg = argv[1];
		if (arg == "--version" || arg == "-V")
			is_version = true;
		else if (arg == "--help" || arg == "-h")
			is_help = true;
		else {
			cerr << argv0 << ": Unrecognized option: " << arg
			     << std::endl;
			is_help = true;
			exit_code = 1;
		}
	}

	Ev::Io<int> run() {
		if (is_version) {
			cout << PACKAGE_STRING << std::endl;
			return Ev::lift(0);
		}
		if (is_help) {
			usage();
			return Ev::lift(exit_code);
		}

		bus = Util::make_unique<S::Bus>();
		threadpool = Util::make_unique<Ev::ThreadPool>();
		jsoninput = Util::make_unique<JsonInput>(*threadpool, cin, *bus);
		modules = Mod::all(cout, *bus, *threadpool, open_rpc_socket);

		return Ev::yield().then([this]() {
			return bus->raise(Msg::Begin());
		}).then([this]() {
			return jsoninput->run().catching<std::exception>([this](std::exception const& e) {
				cerr << argv0 << ": " << e.what() << std::endl;
				exit_code = 1;
				return Ev::lift();
			});
		}).then([this]() {
			return bus->raise(Streamer::Shutdown());
		}).then([this]() {
			return Ev::lift(exit_code);
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::istream& cin
	  , std::ostream& cout
	  , std::ostream& cerr
	  , std::function< Net::Fd( std::string const&
				  , std::string const&
				  )
			 > open_rpc_socket
	  ) : pimpl(Util::make_unique<Impl>( std::move(argv)
					   , cin, cout, cerr
					   , std::move(open_rpc_socket)
					   )) { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	return pimpl->run();
}

}
