#include"Streamer/Mod/CommandReceiver.hpp"
#include"Streamer/Mod/Initiator.hpp"
#include"Streamer/Mod/JsonOutputter.hpp"
#include"Streamer/Mod/Manifester.hpp"
#include"Streamer/Mod/RpcPaymentClient.hpp"
#include"Streamer/Mod/StreamCommands.hpp"
#include"Streamer/Mod/StreamController.hpp"
#include"Streamer/Mod/StreamNotifier.hpp"
#include"Streamer/Mod/all.hpp"
#include<vector>

namespace {

class All {
private:
	std::vector<std::shared_ptr<void>> modules;

public:
	template<typename M, typename... As>
	std::shared_ptr<M> install(As&&... as) {
		auto ptr = std::make_shared<M>(as...);
		modules.push_back(std::shared_ptr<void>(ptr));
		return ptr;
	}
};

}

namespace Streamer { namespace Mod {

std::shared_ptr<void> all( std::ostream& cout
			 , S::Bus& bus
			 , Ev::ThreadPool& threadpool
			 , std::function< Net::Fd( std::string const&
						 , std::string const&
						 )
					> open_rpc_socket
			 ) {
	auto all = std::make_shared<All>();

	/* Basic.  */
	all->install<JsonOutputter>(cout, bus);
	all->install<CommandReceiver>(bus);

	/* Startup.  */
	all->install<Manifester>(bus);
	all->install<Initiator>(bus, threadpool, std::move(open_rpc_socket));

	/* Payments.  */
	all->install<RpcPaymentClient>(bus);

	/* Streams.  */
	auto controller = all->install<StreamController>(bus);
	all->install<StreamCommands>(bus, *controller);
	all->install<StreamNotifier>(bus);

	return all;
}

}}
