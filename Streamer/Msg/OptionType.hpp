#ifndef STREAMER_MSG_OPTIONTYPE_HPP
#define STREAMER_MSG_OPTIONTYPE_HPP

namespace Streamer { namespace Msg {

enum OptionType {
	OptionType_String,
	OptionType_Bool,
	OptionType_Int,
	OptionType_Flag
};

}}

#endif /* !defined(STREAMER_MSG_OPTIONTYPE_HPP) */
