#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Ln/Amount.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Streamer/Mod/Rpc.hpp"
#include"Streamer/Mod/RpcPaymentClient.hpp"
#include"Streamer/Msg/Init.hpp"
#include"Streamer/Msg/PaymentBackend.hpp"
#include"Streamer/PaymentClient.hpp"
#include"Streamer/Shutdown.hpp"
#include"Streamer/StreamError.hpp"
#include<assert.h>
#include<errno.h>
#include<fcntl.h>
#include<sys/socket.h>
#include<sys/types.h>
#include<unistd.h>

namespace {

/* Answers a few lightningd commands over a socket.  */
class FakeLightningd {
private:
	Net::Fd socket;
	Jsmn::Parser parser;
	bool stopped;

	void send(Json::Out js) {
		auto text = js.output() + "\n\n";
		auto p = text.c_str();
		auto left = text.size();
		while (left > 0) {
			auto res = write(socket.get(), p, left);
			if (res < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
				continue;
			assert(res > 0);
			p += res;
			left -= std::size_t(res);
		}
	}
	void result(Jsmn::Object id, Json::Out res) {
		send(Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", id)
				.field("result", res)
			.end_object());
	}
	void error(Jsmn::Object id, int code, std::string message) {
		send(Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", id)
				.start_object("error")
					.field("code", code)
					.field("message", message)
				.end_object()
			.end_object());
	}

	void handle(Jsmn::Object req) {
		auto id = req["id"];
		auto method = std::string(req["method"]);
		auto params = req["params"];
		++requests;
		if (method == "decode") {
			assert(std::string(params["string"]) == "lno1counterparty");
			result(id, Json::Out()
				.start_object()
					.field("type", std::string("bolt12 offer"))
					.field("offer_issuer_id", std::string("02abcd"))
				.end_object());
		} else if (method == "getroute") {
			assert(std::string(params["id"]) == "02abcd");
			assert(double(params["amount_msat"]) == 1000);
			auto res = Json::Out();
			auto obj = res.start_object();
			auto route = obj.start_array("route");
			route.start_object()
				.field("id", std::string("03ffff"))
				.field("amount_msat", 1007)
			.end_object();
			route.start_object()
				.field("id", std::string("02abcd"))
				.field("amount_msat", std::string("1000msat"))
			.end_object();
			route.end_array();
			obj.end_object();
			result(id, res);
		} else if (method == "fetchinvoice") {
			auto offer = std::string(params["offer"]);
			if (offer == "lno1offline")
				return error( id, 1005
					    , "Timeout waiting for response"
					    );
			assert(offer == "lno1counterparty");
			assert(double(params["amount_msat"]) == 1000);
			assert(std::string(params["payer_note"]) == "stream_payment_x");
			result(id, Json::Out()
				.start_object()
					.field("invoice", std::string("lni1invoice"))
				.end_object());
		} else if (method == "pay") {
			assert(std::string(params["bolt11"]) == "lni1invoice");
			result(id, Json::Out()
				.start_object()
					.field("payment_hash", std::string("ab01"))
					.field("status", std::string("complete"))
				.end_object());
		} else if (method == "hang") {
			/* Never answered.  */
		} else
			error(id, -32601, "Unknown command '" + method + "'");
	}

public:
	std::size_t requests;

	explicit
	FakeLightningd(Net::Fd socket_)
		: socket(std::move(socket_)), stopped(false), requests(0) {
		auto flags = fcntl(socket.get(), F_GETFL);
		fcntl(socket.get(), F_SETFL, flags | O_NONBLOCK);
	}

	Ev::Io<void> loop() {
		return Ev::yield().then([this]() {
			if (stopped)
				return Ev::lift();
			char buf[4096];
			for (;;) {
				auto res = read(socket.get(), buf, sizeof(buf));
				if (res < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
					break;
				if (res <= 0) {
					stopped = true;
					break;
				}
				for (auto& req : parser.feed(std::string(buf, std::size_t(res))))
					handle(req);
			}
			return loop();
		});
	}
	void stop() { stopped = true; }
};

}

int main() {
	auto bus = S::Bus();

	int sockets[2];
	auto res = socketpair(AF_UNIX, SOCK_STREAM, 0, sockets);
	assert(res >= 0);

	auto server_fd = Net::Fd(sockets[0]);
	FakeLightningd server(std::move(server_fd));
	auto rpc = Streamer::Mod::Rpc(bus, Net::Fd(sockets[1]));
	Streamer::Mod::RpcPaymentClient client(bus);

	Streamer::PaymentClient* backend = nullptr;
	bus.subscribe<Streamer::Msg::PaymentBackend
		     >([&](Streamer::Msg::PaymentBackend const& m) {
		backend = &m.client;
		return Ev::lift();
	});

	auto errored = false;
	auto offline = false;
	auto shut_down = false;

	auto code = Ev::lift().then([&]() {
		return Ev::concurrent(server.loop());
	}).then([&]() {
		return bus.raise(Streamer::Msg::Init{
			"regtest", rpc, Sqlite3::Db()
		});
	}).then([&]() {
		assert(backend == &client);

		return backend->quote_fee( "lno1counterparty"
					 , Ln::Amount::msat(1000)
					 );
	}).then([&](Ln::Amount fee) {
		assert(fee == Ln::Amount::msat(7));

		return backend->create_invoice( "lno1counterparty"
					      , Ln::Amount::msat(1000)
					      , "stream_payment_x"
					      );
	}).then([&](std::string invoice) {
		assert(invoice == "lni1invoice");
		return backend->pay_invoice(invoice);
	}).then([&](std::string payment_hash) {
		assert(payment_hash == "ab01");

		/* lightningd errors become PaymentClientError.  */
		return backend->create_invoice( "lno1offline"
					      , Ln::Amount::msat(1000)
					      , "stream_payment_x"
					      ).catching<Streamer::PaymentClientError>([&](Streamer::PaymentClientError const& e) {
			offline = Streamer::is_remote_offline(e.what());
			return Ev::lift(std::string());
		});
	}).then([&](std::string) {
		assert(offline);

		/* Plain RPC errors.  */
		return rpc.command("nosuchcommand", Json::Out::empty_object())
			.catching<Streamer::Mod::RpcError>([&](Streamer::Mod::RpcError const& e) {
			errored = ( e.code() == -32601
				 && e.command == "nosuchcommand"
				  );
			return Ev::lift(Jsmn::Object());
		});
	}).then([&](Jsmn::Object) {
		assert(errored);

		/* Outstanding commands fail on shutdown.  */
		auto hang = rpc.command("hang", Json::Out::empty_object())
			.catching<Streamer::Shutdown>([&](Streamer::Shutdown const&) {
			shut_down = true;
			return Ev::lift(Jsmn::Object());
		}).then([](Jsmn::Object) {
			return Ev::lift();
		});
		return Ev::concurrent(hang)
		     + Ev::yield(20)
		     + bus.raise(Streamer::Shutdown());
	}).then([&]() {
		return Ev::yield(5);
	}).then([&]() {
		server.stop();
		assert(shut_down);
		assert(server.requests == 7);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
