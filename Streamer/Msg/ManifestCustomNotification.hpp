#ifndef STREAMER_MSG_MANIFESTCUSTOMNOTIFICATION_HPP
#define STREAMER_MSG_MANIFESTCUSTOMNOTIFICATION_HPP

#include<string>

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::ManifestCustomNotification
 *
 * @brief declares, in the manifest, a notification
 * topic this plugin emits.
 */
struct ManifestCustomNotification {
	std::string name;
};

}}

#endif /* !defined(STREAMER_MSG_MANIFESTCUSTOMNOTIFICATION_HPP) */
