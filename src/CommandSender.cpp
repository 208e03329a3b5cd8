#include "ArdourOsc/CommandSender.h"

#include <memory>
#include <mutex>

#include "ArdourOsc/CommandCatalogue.h"
#include "ArdourOsc/Exceptions.h"
#include "ArdourOsc/Logging.h"
#include "ArdourOsc/Message.h"
#include "LoMessage.h"

namespace ArdourOsc
{
	class CommandSender::Impl
	{
	public:
		Impl() : m_address(nullptr), m_sent(0) {}

		~Impl()
		{
			closeLocked();
		}

		void closeLocked()
		{
			if (m_address)
			{
				lo_address_free(m_address);
				m_address = nullptr;
			}
		}

		mutable std::mutex m_mutex;
		lo_address m_address;
		uint64_t m_sent;
	};

	CommandSender::CommandSender(std::string host, int port)
		: m_host(std::move(host)), m_port(port), m_impl(std::make_unique<Impl>())
	{
	}

	CommandSender::~CommandSender() = default;

	Status CommandSender::open()
	{
		std::lock_guard<std::mutex> lock(m_impl->m_mutex);
		if (m_impl->m_address)
			return Status::success();

		if (m_host.empty() || m_port <= 0 || m_port > 65535)
		{
			return Status::failure(ErrorCode::ConnectionError,
								   "invalid command target " + m_host + ":" + std::to_string(m_port));
		}

		m_impl->m_address = lo_address_new(m_host.c_str(), std::to_string(m_port).c_str());
		if (!m_impl->m_address)
		{
			std::string message = "failed to create OSC address for " + m_host + ":" + std::to_string(m_port);
			log_error("%s", message.c_str());
			return Status::failure(ErrorCode::ConnectionError, message);
		}

		log_info("Sending commands to %s:%d", m_host.c_str(), m_port);
		return Status::success();
	}

	void CommandSender::close()
	{
		std::lock_guard<std::mutex> lock(m_impl->m_mutex);
		m_impl->closeLocked();
	}

	bool CommandSender::isOpen() const
	{
		std::lock_guard<std::mutex> lock(m_impl->m_mutex);
		return m_impl->m_address != nullptr;
	}

	uint64_t CommandSender::sentCount() const
	{
		std::lock_guard<std::mutex> lock(m_impl->m_mutex);
		return m_impl->m_sent;
	}

	Status CommandSender::send(const std::string &address, const std::vector<Value> &args)
	{
		std::vector<Value> prepared;
		LoMessagePtr msg;
		try
		{
			prepared = CommandCatalogue::prepare(address, args);
			msg = encodeLoMessage(address, prepared);
		}
		catch (const ValidationError &e)
		{
			log_warning("Rejected command %s: %s", address.c_str(), e.what());
			return Status::fromException(e);
		}

		std::lock_guard<std::mutex> lock(m_impl->m_mutex);
		if (!m_impl->m_address)
			return Status::failure(ErrorCode::NotConnected, "command sender is not open");

		int result = lo_send_message(m_impl->m_address, address.c_str(), msg.get());
		if (result < 0)
		{
			std::string reason = lo_address_errstr(m_impl->m_address) ? lo_address_errstr(m_impl->m_address) : "unknown error";
			log_warning("Failed to send %s to %s:%d: %s", address.c_str(), m_host.c_str(), m_port, reason.c_str());
			return Status::failure(ErrorCode::SendError, "failed to send " + address + ": " + reason);
		}

		++m_impl->m_sent;
		if (log_get_level() >= LOG_DEBUG)
			log_debug("Sent %s", Message(address, prepared).toString().c_str());
		return Status::success();
	}

} // namespace ArdourOsc
