#ifndef STREAMER_MSG_INIT_HPP
#define STREAMER_MSG_INIT_HPP

#include"Sqlite3/Db.hpp"
#include<string>

namespace Streamer { namespace Mod { class Rpc; }}

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::Init
 *
 * @brief raised once `init` has connected to the
 * lightningd RPC socket and opened the database.
 */
struct Init {
	std::string network;
	Streamer::Mod::Rpc& rpc;
	Sqlite3::Db db;
};

}}

#endif /* !defined(STREAMER_MSG_INIT_HPP) */
