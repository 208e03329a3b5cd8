#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ArdourOsc/Status.h"
#include "ArdourOsc/Value.h"

namespace ArdourOsc
{
	/**
	 * @brief One-way OSC transmitter to the remote application
	 *
	 * Uses a liblo UDP address. Sends are serialised by an internal lock so
	 * any number of threads may share one sender. Success means the local
	 * socket accepted the datagram; nothing is acknowledged.
	 */
	class CommandSender
	{
	public:
		/**
		 * @param host Remote host name or IPv4 address
		 * @param port Remote UDP port (Ardour listens on 3819)
		 */
		CommandSender(std::string host, int port);
		~CommandSender();

		CommandSender(const CommandSender &) = delete;
		CommandSender &operator=(const CommandSender &) = delete;

		/**
		 * @brief Create the liblo address
		 *
		 * @return ConnectionError if the address cannot be created
		 */
		Status open();

		void close();

		bool isOpen() const;

		/**
		 * @brief Validate, encode and send one command
		 *
		 * @param address OSC address, e.g. "/transport_play"
		 * @param args Arguments, coerced to the command's signature when the
		 *        address is a known command
		 * @return ValidationError for a rejected command, SendError when the
		 *         socket refused the datagram, NotConnected if not open
		 */
		Status send(const std::string &address, const std::vector<Value> &args = {});

		const std::string &host() const { return m_host; }
		int port() const { return m_port; }

		/**
		 * @brief Number of datagrams accepted by the socket
		 */
		uint64_t sentCount() const;

	private:
		class Impl;

		std::string m_host;
		int m_port;
		std::unique_ptr<Impl> m_impl;
	};

} // namespace ArdourOsc
