#ifndef STREAMER_STREAMSTORE_HPP
#define STREAMER_STREAMSTORE_HPP

#include"Sqlite3/Db.hpp"
#include"Streamer/StreamPayment.hpp"
#include<cstddef>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Streamer {

/** class Streamer::StreamStore
 *
 * @brief durable record of stream payments and of
 * each part paid.
 *
 * @desc Writes are best-effort: a failed write is
 * logged and otherwise ignored, so the in-memory
 * state that triggered it is never held back.
 * Reads do throw.
 */
class StreamStore {
private:
	S::Bus& bus;
	Sqlite3::Db db;

	Ev::Io<void> best_effort(char const* what, Ev::Io<void> act);

public:
	StreamStore(S::Bus& bus, Sqlite3::Db db);

	/* Creates the tables if needed.  */
	Ev::Io<void> init();

	Ev::Io<void> insert_stream(StreamPayment const&);
	Ev::Io<void> update_stream_progress( std::string const& id
					   , std::size_t parts_paid
					   , StreamStatus status
					   );
	Ev::Io<void> insert_part( std::string const& payment_hash
				, std::string const& stream_id
				);
	/* Marks streams that were running when the
	 * process last stopped as paused.  */
	Ev::Io<void> reset_running_to_paused();

	/* Newest first.  `parts_requested` is zero.  */
	Ev::Io<std::vector<StreamPayment>> list_streams();
	Ev::Io<std::size_t> count_parts(std::string const& stream_id);
};

}

#endif /* !defined(STREAMER_STREAMSTORE_HPP) */
