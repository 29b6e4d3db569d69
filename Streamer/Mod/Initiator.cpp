#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Streamer/Mod/Initiator.hpp"
#include"Streamer/Mod/Rpc.hpp"
#include"Streamer/Msg/CommandRequest.hpp"
#include"Streamer/Msg/CommandResponse.hpp"
#include"Streamer/Msg/DbResource.hpp"
#include"Streamer/Msg/Init.hpp"
#include"Streamer/Msg/ManifestOption.hpp"
#include"Streamer/Msg/Option.hpp"
#include"Streamer/log.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<set>
#include<stdexcept>

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif
#ifndef PACKAGE_STRING
# define PACKAGE_STRING "clstreamer"
#endif

namespace {

/* Bad `init` parameters.  */
struct InitError : public std::runtime_error {
	explicit
	InitError(std::string const& msg) : std::runtime_error(msg) { }
};

std::string string_config( Jsmn::Object const& configuration
			 , char const* key
			 , std::string fallback
			 ) {
	if (!configuration.has(key))
		return fallback;
	auto js = configuration[key];
	if (!js.is_string())
		throw InitError(std::string(key) + " not a string");
	return std::string(js);
}

}

namespace Streamer { namespace Mod {

class Initiator::Impl {
private:
	S::Bus& bus;
	Ev::ThreadPool& threadpool;
	std::function<Net::Fd( std::string const&
			     , std::string const&
			     )> open_rpc_socket;

	bool initted;
	std::set<std::string> option_names;

	std::unique_ptr<Rpc> rpc;
	Sqlite3::Db db;

	Ev::Io<void> raise_options(Jsmn::Object const& params) {
		auto act = Ev::lift();
		if (!params.has("options"))
			return act;
		auto opts = params["options"];
		if (!opts.is_object())
			throw InitError("options not an object");
		for (auto const& name : option_names)
			if (opts.has(name))
				act += bus.raise(Msg::Option{name, opts[name]});
		return act;
	}

	Ev::Io<void> init(Jsmn::Object id, Jsmn::Object params) {
		if (initted)
			throw InitError("init received twice");
		initted = true;
		if (!params.is_object() || !params["configuration"].is_object())
			throw InitError("no configuration object");

		auto configuration = params["configuration"];
		auto network = string_config(configuration, "network", "bitcoin");
		auto lightning_dir = string_config(configuration, "lightning-dir", ".");
		auto rpc_file = string_config(configuration, "rpc-file", "lightning-rpc");

		return Streamer::log(bus, Info, "%s", PACKAGE_STRING)
		     + raise_options(params)
		     + threadpool.background<Net::Fd>([this, lightning_dir, rpc_file]() {
			return open_rpc_socket(lightning_dir, rpc_file);
		}).then([this](Net::Fd fd) {
			rpc = Util::make_unique<Rpc>(bus, std::move(fd));
			db = Sqlite3::Db("data.streamer");
			return db.transact();
		}).then([this](Sqlite3::Tx tx) {
			/* "STRM" */
			tx.query_execute("PRAGMA application_id = 0x5354524D;");
			tx.commit();
			return Streamer::log(bus, Debug, "Database data.streamer opened.");
		}).then([this]() {
			return bus.raise(Msg::DbResource{db});
		}).then([this, network]() {
			return bus.raise(Msg::Init{network, *rpc, db});
		}).then([this, id]() {
			return bus.raise(Msg::CommandResponse{
				id, Json::Out::empty_object()
			});
		}).then([this]() {
			return Streamer::log(bus, Info, "Started.");
		});
	}

	Ev::Io<void> disable(Jsmn::Object id, std::string const& why) {
		return Streamer::log(bus, Error, "init: %s", why.c_str())
		     + bus.raise(Msg::CommandResponse{id, Json::Out()
				.start_object()
					.field("disable", why)
				.end_object()
			});
	}

public:
	Impl( S::Bus& bus_
	    , Ev::ThreadPool& threadpool_
	    , std::function<Net::Fd( std::string const&
				   , std::string const&
				   )> open_rpc_socket_
	    ) : bus(bus_)
	      , threadpool(threadpool_)
	      , open_rpc_socket(std::move(open_rpc_socket_))
	      , initted(false)
	      {
		bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& c) {
			if (c.command != "init")
				return Ev::lift();
			auto id = c.id;
			auto params = c.params;
			return Ev::lift().then([this, id, params]() {
				return init(id, params);
			}).catching<std::exception>([this, id](std::exception const& e) {
				return disable(id, e.what());
			});
		});
		bus.subscribe<Msg::ManifestOption>([this](Msg::ManifestOption const& o) {
			option_names.insert(o.name);
			return Ev::lift();
		});
	}
};

Initiator::Initiator( S::Bus& bus
		    , Ev::ThreadPool& threadpool
		    , std::function<Net::Fd( std::string const&
					   , std::string const&
					   )> open_rpc_socket
		    ) : pimpl(Util::make_unique<Impl>( bus, threadpool
						     , std::move(open_rpc_socket)
						     )) { }
Initiator::Initiator(Initiator&& o) : pimpl(std::move(o.pimpl)) { }
Initiator::~Initiator() { }

}}
