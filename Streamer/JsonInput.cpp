#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"S/Bus.hpp"
#include"Streamer/JsonInput.hpp"
#include"Streamer/Msg/JsonCin.hpp"
#include"Util/make_unique.hpp"
#include<string>
#include<vector>

namespace Streamer {

class JsonInput::Impl {
private:
	Ev::ThreadPool& threadpool;
	std::istream& cin;
	S::Bus& bus;
	Jsmn::Parser parser;

	/* Empty pointer at end-of-file.  */
	Ev::Io<std::shared_ptr<std::string>> read_line() {
		return threadpool.background<std::shared_ptr<std::string>>([this]() {
			auto line = std::make_shared<std::string>();
			if (!std::getline(cin, *line))
				return std::shared_ptr<std::string>();
			line->push_back('\n');
			return line;
		});
	}

	Ev::Io<void> raise_all(std::shared_ptr<std::vector<Jsmn::Object>> objs
			      , std::size_t i
			      ) {
		if (i >= objs->size())
			return Ev::lift();
		return bus.raise(Msg::JsonCin{(*objs)[i]})
		     + Ev::lift().then([this, objs, i]() {
			return raise_all(objs, i + 1);
		});
	}

public:
	Impl( Ev::ThreadPool& threadpool_
	    , std::istream& cin_
	    , S::Bus& bus_
	    ) : threadpool(threadpool_), cin(cin_), bus(bus_) { }

	Ev::Io<void> run() {
		return read_line().then([this](std::shared_ptr<std::string> line) {
			if (!line)
				return Ev::lift();
			auto objs = std::make_shared<std::vector<Jsmn::Object>>(
				parser.feed(*line)
			);
			return raise_all(objs, 0)
			     + Ev::lift().then([this]() { return run(); })
			     ;
		});
	}
};

JsonInput::JsonInput( Ev::ThreadPool& threadpool
		    , std::istream& cin
		    , S::Bus& bus
		    ) : pimpl(Util::make_unique<Impl>(threadpool, cin, bus)) { }
JsonInput::JsonInput(JsonInput&& o) : pimpl(std::move(o.pimpl)) { }
JsonInput::~JsonInput() { }

Ev::Io<void> JsonInput::run() {
	return pimpl->run();
}

}
