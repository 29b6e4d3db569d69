#include"Ev/Io.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Streamer/Mod/Rpc.hpp"
#include"Streamer/Shutdown.hpp"
#include"Streamer/log.hpp"
#include"Util/make_unique.hpp"
#include<errno.h>
#include<exception>
#include<ev.h>
#include<fcntl.h>
#include<map>
#include<sstream>
#include<string.h>
#include<unistd.h>

namespace {

std::string describe(std::string const& command, Jsmn::Object const& e) {
	auto os = std::ostringstream();
	os << command << ": " << e;
	return os.str();
}

/* Keep the debug logs readable.  */
std::string clip(std::string s) {
	if (s.size() > 160)
		s = s.substr(0, 160) + "...";
	return s;
}

}

namespace Streamer { namespace Mod {

RpcError::RpcError(std::string command_, Jsmn::Object error_)
	: Util::BacktraceException<std::runtime_error>(
		describe(command_, error_)
	  )
	, command(std::move(command_))
	, error(std::move(error_)) { }

int RpcError::code() const {
	if (error.is_object() && error["code"].is_number())
		return int(double(error["code"]));
	return 0;
}
std::string RpcError::message() const {
	if (error.is_object() && error["message"].is_string())
		return std::string(error["message"]);
	auto os = std::ostringstream();
	os << error;
	return os.str();
}

class Rpc::Impl {
private:
	S::Bus& bus;
	Net::Fd socket;
	Jsmn::Parser parser;

	bool closed;
	std::exception_ptr close_reason;
	std::uint64_t next_id;

	struct Pending {
		std::string command;
		std::function<void(Jsmn::Object)> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	std::map<std::uint64_t, Pending> pending;

	std::string out_buf;
	ev_io read_watcher;
	ev_io write_watcher;

	/* Fails everything outstanding, and everything
	 * submitted later.  */
	void close_with(std::exception_ptr e) {
		if (closed)
			return;
		closed = true;
		close_reason = e;
		ev_io_stop(EV_DEFAULT_ &read_watcher);
		ev_io_stop(EV_DEFAULT_ &write_watcher);
		auto failing = std::move(pending);
		pending.clear();
		for (auto& p : failing)
			p.second.fail(e);
	}
	template<typename E>
	void close_with(E e) {
		close_with(std::make_exception_ptr(e));
	}

	void on_response(Jsmn::Object const& resp) {
		if (!resp.is_object() || !resp["id"].is_number())
			return;
		auto id = std::uint64_t(double(resp["id"]));
		auto it = pending.find(id);
		if (it == pending.end())
			return;
		auto p = std::move(it->second);
		pending.erase(it);
		if (resp.has("error"))
			p.fail(std::make_exception_ptr(
				RpcError(std::move(p.command), resp["error"])
			));
		else
			p.pass(resp["result"]);
	}

	void on_readable() {
		char buf[4096];
		auto res = ssize_t();
		do {
			res = read(socket.get(), buf, sizeof(buf));
		} while (res < 0 && errno == EINTR);
		if (res < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
			return;
		if (res <= 0) {
			auto msg = res == 0 ? std::string("unexpected end-of-file")
					    : std::string(strerror(errno))
					    ;
			close_with(Util::BacktraceException<std::runtime_error>(
				"Rpc: read: " + msg
			));
			return;
		}
		auto responses = std::vector<Jsmn::Object>();
		try {
			responses = parser.feed(std::string(buf, std::size_t(res)));
		} catch (std::exception const&) {
			close_with(std::current_exception());
			return;
		}
		for (auto const& r : responses)
			on_response(r);
	}
	static
	void on_readable_static(EV_P_ ev_io* w, int) {
		static_cast<Impl*>(w->data)->on_readable();
	}

	void on_writable() {
		while (!out_buf.empty()) {
			auto res = ssize_t();
			do {
				res = write(socket.get(), out_buf.data(), out_buf.size());
			} while (res < 0 && errno == EINTR);
			if (res < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
				break;
			if (res < 0) {
				close_with(Util::BacktraceException<std::runtime_error>(
					std::string("Rpc: write: ") + strerror(errno)
				));
				return;
			}
			out_buf.erase(0, std::size_t(res));
		}
		if (out_buf.empty())
			ev_io_stop(EV_DEFAULT_ &write_watcher);
		else
			ev_io_start(EV_DEFAULT_ &write_watcher);
	}
	static
	void on_writable_static(EV_P_ ev_io* w, int) {
		static_cast<Impl*>(w->data)->on_writable();
	}

	Ev::Io<Jsmn::Object> send(std::string const& command, Json::Out params) {
		return Ev::Io<Jsmn::Object>([this, command, params
					    ]( std::function<void(Jsmn::Object)> pass
					     , std::function<void(std::exception_ptr)> fail
					     ) {
			if (closed) {
				fail(close_reason);
				return;
			}
			auto id = next_id++;
			out_buf += Json::Out()
				.start_object()
					.field("jsonrpc", std::string("2.0"))
					.field("id", id)
					.field("method", command)
					.field("params", params)
				.end_object()
				.output();
			out_buf += "\n\n";
			pending[id] = Pending{command, std::move(pass), std::move(fail)};
			on_writable();
		});
	}

public:
	Impl(S::Bus& bus_, Net::Fd socket_)
		: bus(bus_), socket(std::move(socket_))
		, closed(false), next_id(1) {
		auto flags = fcntl(socket.get(), F_GETFL);
		fcntl(socket.get(), F_SETFL, flags | O_NONBLOCK);

		ev_io_init( &read_watcher, &on_readable_static
			  , socket.get(), EV_READ
			  );
		read_watcher.data = this;
		ev_io_start(EV_DEFAULT_ &read_watcher);

		ev_io_init( &write_watcher, &on_writable_static
			  , socket.get(), EV_WRITE
			  );
		write_watcher.data = this;

		bus.subscribe<Streamer::Shutdown>([this](Streamer::Shutdown const&) {
			close_with(Streamer::Shutdown());
			return Ev::lift();
		});
	}
	~Impl() {
		close_with(Streamer::Shutdown());
	}

	Ev::Io<Jsmn::Object> command(std::string const& command, Json::Out params) {
		auto text = clip(params.output());
		return Streamer::log( bus, Debug, "Rpc out: %s %s"
				    , command.c_str(), text.c_str()
				    ).then([this, command, params]() {
			return send(command, params);
		}).then([this, command](Jsmn::Object result) {
			auto os = std::ostringstream();
			os << result;
			return Streamer::log( bus, Debug, "Rpc in: %s => %s"
					    , command.c_str(), clip(os.str()).c_str()
					    ).then([result]() {
				return Ev::lift(result);
			});
		}).catching<RpcError>([this, command](RpcError const& e) {
			auto err = std::make_shared<RpcError>(e);
			return Streamer::log( bus, Debug, "Rpc in: %s => error %s"
					    , command.c_str(), clip(e.message()).c_str()
					    ).then([err]() -> Ev::Io<Jsmn::Object> {
				throw *err;
			});
		});
	}
};

Rpc::Rpc(S::Bus& bus, Net::Fd socket)
	: pimpl(Util::make_unique<Impl>(bus, std::move(socket))) { }
Rpc::Rpc(Rpc&& o) : pimpl(std::move(o.pimpl)) { }
Rpc::~Rpc() { }

Ev::Io<Jsmn::Object> Rpc::command( std::string const& command
				 , Json::Out params
				 ) {
	return pimpl->command(command, std::move(params));
}

}}
