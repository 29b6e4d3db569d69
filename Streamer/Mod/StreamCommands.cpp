#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/Amount.hpp"
#include"S/Bus.hpp"
#include"Streamer/Mod/StreamCommands.hpp"
#include"Streamer/Mod/StreamController.hpp"
#include"Streamer/Msg/CommandFail.hpp"
#include"Streamer/Msg/CommandRequest.hpp"
#include"Streamer/Msg/CommandResponse.hpp"
#include"Streamer/Msg/ManifestCommand.hpp"
#include"Streamer/Msg/Manifestation.hpp"
#include"Streamer/StreamError.hpp"
#include"Streamer/StreamPayment.hpp"
#include"Streamer/StreamRegistry.hpp"
#include"Streamer/concurrent.hpp"
#include"Util/make_unique.hpp"
#include<cmath>
#include<cstdint>
#include<map>
#include<vector>

namespace {

auto const default_delay = std::uint64_t(1000);
auto const default_parts = std::size_t(1);

/* Thrown while reading command parameters.  */
struct ParamError : public std::invalid_argument {
	explicit
	ParamError(std::string const& msg) : std::invalid_argument(msg) { }
};

/* Parameters given either as an array, in the
 * order of `names`, or as an object keyed by
 * them.  */
class Params {
private:
	Jsmn::Object params;
	std::vector<std::string> names;

public:
	Params( Jsmn::Object params_
	      , std::vector<std::string> names_
	      ) : params(std::move(params_)), names(std::move(names_)) {
		if (params.is_array()) {
			if (params.size() > names.size())
				throw ParamError("Too many parameters.");
		} else if (params.is_object()) {
			for (auto const& k : params.keys()) {
				auto known = false;
				for (auto const& n : names)
					if (k == n)
						known = true;
				if (!known)
					throw ParamError("Unknown parameter: " + k);
			}
		} else if (!params.is_null())
			throw ParamError("Parameters must be array or object.");
	}

	/* Null if absent.  */
	Jsmn::Object get(std::string const& name) const {
		if (params.is_null())
			return Jsmn::Object();
		if (params.is_object())
			return params[name];
		for (auto i = std::size_t(0); i < names.size(); ++i)
			if (names[i] == name) {
				if (i >= params.size())
					return Jsmn::Object();
				return params[i];
			}
		return Jsmn::Object();
	}
	/* Throws unless no parameters were given.  */
	static void none(Jsmn::Object const& params) {
		Params(params, std::vector<std::string>());
	}

	bool has(std::string const& name) const {
		return !get(name).is_null();
	}

	std::string string(std::string const& name) const {
		auto js = get(name);
		if (!js.is_string())
			throw ParamError(name + " must be a string.");
		return std::string(js);
	}
	std::uint64_t uint(std::string const& name) const {
		auto js = get(name);
		if (!js.is_number())
			throw ParamError(name + " must be a number.");
		auto v = double(js);
		if (v < 0 || std::floor(v) != v || v > 9.0e18)
			throw ParamError(name + " must be a non-negative integer.");
		return std::uint64_t(v);
	}
	Ln::Amount amount(std::string const& name) const {
		auto js = get(name);
		if (!Ln::Amount::valid_object(js))
			throw ParamError(name + " must be an amount in msat.");
		return Ln::Amount::object(js);
	}
};

}

namespace Streamer { namespace Mod {

class StreamCommands::Impl {
private:
	S::Bus& bus;
	StreamController& controller;

	struct Command {
		std::string usage;
		std::string description;
		std::function<Ev::Io<Json::Out>(Jsmn::Object const&)> run;
	};
	std::map<std::string, Command> commands;

	void start() {
		add( "streamer-prepare"
		   , "counterparty price [delay] [parts] [name]"
		   , "Prepare a stream of {parts} payments of {price} "
		     "each to the offer {counterparty}, one every "
		     "{delay} milliseconds, and quote its fee.  "
		     "The draft is kept until committed or cleared."
		   , [this](Jsmn::Object const& js) {
			auto p = Params(js, { "counterparty", "price"
					    , "delay", "parts", "name"
					    });
			auto counterparty = p.string("counterparty");
			if (counterparty.empty())
				throw ParamError("counterparty is empty.");
			auto price = p.amount("price");
			if (price == Ln::Amount())
				throw ParamError("price must be nonzero.");
			auto delay = p.has("delay") ? p.uint("delay")
						    : default_delay;
			auto parts = p.has("parts") ? std::size_t(p.uint("parts"))
						    : default_parts;
			if (parts == 0)
				throw ParamError("parts must be nonzero.");
			auto name = p.has("name") ? p.string("name")
						  : std::string();
			return controller.prepare( counterparty, price
						 , delay, parts, name
						 ).then([](StreamPayment draft) {
				return Ev::lift(stream_to_json(draft));
			});
		});
		add( "streamer-clear", ""
		   , "Discard the prepared stream payment, if any."
		   , [this](Jsmn::Object const& js) {
			Params::none(js);
			return controller.clear().then([]() {
				return Ev::lift(Json::Out::empty_object());
			});
		});
		add( "streamer-commit", ""
		   , "Save the prepared stream payment, paused."
		   , [this](Jsmn::Object const& js) {
			Params::none(js);
			return controller.commit().then([](StreamPayment p) {
				return Ev::lift(stream_to_json(p));
			});
		});
		add_by_id( "streamer-start"
			 , "Start paying stream {id}, pausing any "
			   "other running stream."
			 , &StreamController::start
			 );
		add_by_id( "streamer-pause"
			 , "Pause stream {id}."
			 , &StreamController::pause
			 );
		add_by_id( "streamer-finish"
			 , "End stream {id}; it cannot be restarted."
			 , &StreamController::finish
			 );
		add( "streamer-list", ""
		   , "List stream payments, newest first."
		   , [this](Jsmn::Object const& js) {
			Params::none(js);
			auto out = Json::Out();
			auto obj = out.start_object();
			auto arr = obj.start_array("streams");
			for (auto const& p : controller.list())
				arr.entry(stream_to_json(p));
			arr.end_array();
			obj.end_object();
			return Ev::lift(out);
		});

		bus.subscribe<Msg::Manifestation
			     >([this](Msg::Manifestation const&) {
			auto act = Ev::lift();
			for (auto const& c : commands)
				act += bus.raise(Msg::ManifestCommand{
					c.first,
					c.second.usage,
					c.second.description,
					false
				});
			return act;
		});
		bus.subscribe<Msg::CommandRequest
			     >([this](Msg::CommandRequest const& r) {
			auto it = commands.find(r.command);
			if (it == commands.end())
				return Ev::lift();
			return Streamer::concurrent(
				execute(it->second.run, r.params, r.id)
			);
		});
	}

	void add( std::string const& name
		, std::string const& usage
		, std::string const& description
		, std::function<Ev::Io<Json::Out>(Jsmn::Object const&)> run
		) {
		commands[name] = Command{usage, description, std::move(run)};
	}
	void add_by_id( std::string const& name
		      , std::string const& description
		      , Ev::Io<void> (StreamController::*op)(std::string const&)
		      ) {
		add(name, "id", description, [this, op](Jsmn::Object const& js) {
			auto p = Params(js, {"id"});
			auto id = p.string("id");
			return (controller.*op)(id).then([this, id]() -> Ev::Io<Json::Out> {
				auto e = controller.registry().get(id);
				if (!e)
					return Ev::lift(Json::Out::empty_object());
				return Ev::lift(stream_to_json(e->payment));
			});
		});
	}

	Ev::Io<void>
	execute( std::function<Ev::Io<Json::Out>(Jsmn::Object const&)> run
	       , Jsmn::Object params
	       , Jsmn::Object id
	       ) {
		return Ev::lift().then([this, run, params, id]() -> Ev::Io<void> {
			auto act = Ev::Io<Json::Out>(Ev::lift(Json::Out()));
			try {
				act = run(params);
			} catch (ParamError const& e) {
				return invalid(id, params, e.what());
			} catch (Jsmn::TypeError const& e) {
				return invalid(id, params, e.what());
			}
			return act.then([this, id](Json::Out result) {
				return bus.raise(Msg::CommandResponse{
					id, std::move(result)
				});
			}).catching<StreamError>([this, id](StreamError const& e) {
				return bus.raise(Msg::CommandFail{
					id, -1, e.what(),
					Json::Out()
						.start_object()
							.field( "error"
							      , std::string(error_code_name(e.code))
							      )
						.end_object()
				});
			});
		});
	}

	Ev::Io<void> invalid( Jsmn::Object const& id
			    , Jsmn::Object const& params
			    , std::string const& why
			    ) {
		return bus.raise(Msg::CommandFail{
			id, -32602, "Invalid parameters: " + why,
			Json::Out()
				.start_object()
					.field("params", params)
				.end_object()
		});
	}

public:
	Impl() =delete;
	Impl(Impl&&) =delete;
	Impl(Impl const&) =delete;

	Impl( S::Bus& bus_
	    , StreamController& controller_
	    ) : bus(bus_), controller(controller_) { start(); }
};

StreamCommands::StreamCommands(StreamCommands&&) =default;
StreamCommands::~StreamCommands() =default;

StreamCommands::StreamCommands(S::Bus& bus, StreamController& controller)
	: pimpl(Util::make_unique<Impl>(bus, controller)) { }

}}
