#ifndef STREAMER_MSG_DBRESOURCE_HPP
#define STREAMER_MSG_DBRESOURCE_HPP

#include"Sqlite3/Db.hpp"

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::DbResource
 *
 * @brief the plugin database, raised just before
 * Streamer::Msg::Init.
 *
 * @desc Modules that need only the database listen
 * here so tests can hand them an in-memory one
 * without an RPC socket.
 */
struct DbResource {
	Sqlite3::Db db;
};

}}

#endif /* !defined(STREAMER_MSG_DBRESOURCE_HPP) */
