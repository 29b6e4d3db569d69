#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Net/Fd.hpp"
#include"Streamer/Main.hpp"
#include"Streamer/open_rpc_socket.hpp"
#include<iostream>
#include<memory>
#include<string>
#include<vector>

namespace {

Ev::Io<int> io_main(int argc, char** argv) {
	auto args = std::vector<std::string>(argv, argv + argc);
	auto main_obj = std::make_shared<Streamer::Main>(
		std::move(args), std::cin, std::cout, std::cerr,
		&Streamer::open_rpc_socket
	);
	return main_obj->run().then([main_obj](int ec) {
		/* Keeps main_obj alive until the loop is done.  */
		return Ev::lift(ec);
	});
}

}

int main(int argc, char** argv) {
	/* Build the action before starting the loop; input may
	 * already be waiting on stdin.  */
	auto code = io_main(argc, argv);
	return Ev::start(code);
}
