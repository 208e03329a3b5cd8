// Private helpers binding Value lists to liblo message handles.
#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <vector>

extern "C"
{
#include <lo/lo.h>
}

#include "ArdourOsc/Value.h"

namespace ArdourOsc
{
	struct LoMessageDeleter
	{
		void operator()(lo_message msg) const
		{
			if (msg)
				lo_message_free(msg);
		}
	};

	using LoMessagePtr = std::unique_ptr<std::remove_pointer_t<lo_message>, LoMessageDeleter>;

	/**
	 * @brief Build a liblo message from typed arguments
	 *
	 * @throws ValidationError if liblo cannot hold one of the arguments
	 */
	LoMessagePtr buildLoMessage(const std::vector<Value> &args);

	/**
	 * @brief Validate and build one outgoing message
	 *
	 * The single encoding path: OscCodec::encode serialises the result to
	 * bytes and CommandSender hands it to lo_send_message.
	 *
	 * @param encodedLength Receives the wire size when not null
	 * @throws ValidationError for a bad address, an unsupported argument or a
	 *         message larger than OscCodec::MAX_PACKET_SIZE
	 */
	LoMessagePtr encodeLoMessage(const std::string &address, const std::vector<Value> &args,
								 size_t *encodedLength = nullptr);

} // namespace ArdourOsc
