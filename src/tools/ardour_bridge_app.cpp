#include <signal.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "ArdourOsc/ConfigurationParser.h"
#include "ArdourOsc/Logging.h"
#include "ArdourOsc/OscBridge.h"
#include "ArdourOsc/StateSerializer.h"

/**
 * Command line front end for the bridge
 *
 * Connects to Ardour, optionally sends one command, optionally collects
 * feedback for a while, then prints the cached session as JSON.
 */

namespace
{
	const int EXIT_CONFIG = 1;
	const int EXIT_CONNECTION = 2;
	const int EXIT_SEND = 3;

	std::atomic<bool> g_running(true);

	void signal_handler(int)
	{
		g_running = false;
	}

	void printUsage(const char *program)
	{
		std::cout << "Usage: " << program << " [options] [--send <address> [args...]] [--watch <seconds>]" << std::endl;
		std::cout << "Options:" << std::endl;
		std::cout << ArdourOsc::ConfigurationParser::usage();
		std::cout << "  --send <address> [args...]  Send one command; args are typed as int, float or string" << std::endl;
		std::cout << "  --watch <seconds>          Collect feedback before printing the state" << std::endl;
		std::cout << "  --help, -h                 Show this help" << std::endl;
	}

	// "3" -> int32, "5000000000" -> int64, "-6.5" -> float, anything else -> string
	ArdourOsc::Value inferValue(const std::string &text)
	{
		if (!text.empty())
		{
			errno = 0;
			char *end = nullptr;
			long long integer = std::strtoll(text.c_str(), &end, 10);
			if (errno == 0 && end && *end == '\0')
			{
				if (integer >= INT_MIN && integer <= INT_MAX)
					return ArdourOsc::Value(static_cast<int32_t>(integer));
				return ArdourOsc::Value(static_cast<int64_t>(integer));
			}

			errno = 0;
			end = nullptr;
			double real = std::strtod(text.c_str(), &end);
			if (errno == 0 && end && *end == '\0')
				return ArdourOsc::Value(static_cast<float>(real));
		}
		return ArdourOsc::Value(text);
	}
}

int main(int argc, char *argv[])
{
	for (int i = 1; i < argc; i++)
	{
		std::string arg = argv[i];
		if (arg == "--help" || arg == "-h")
		{
			printUsage(argv[0]);
			return 0;
		}
	}

	ArdourOsc::BridgeConfig config;
	std::vector<std::string> extra;
	if (!ArdourOsc::ConfigurationParser::parseCommandLine(argc, argv, config, &extra))
	{
		printUsage(argv[0]);
		return EXIT_CONFIG;
	}

	std::string sendAddress;
	std::vector<ArdourOsc::Value> sendArgs;
	double watchSeconds = 0.0;

	for (size_t i = 0; i < extra.size(); i++)
	{
		if (extra[i] == "--send")
		{
			if (i + 1 >= extra.size())
			{
				std::cerr << "Missing address for --send" << std::endl;
				return EXIT_CONFIG;
			}
			sendAddress = extra[++i];
			while (i + 1 < extra.size() && extra[i + 1] != "--watch")
				sendArgs.push_back(inferValue(extra[++i]));
		}
		else if (extra[i] == "--watch")
		{
			if (i + 1 >= extra.size())
			{
				std::cerr << "Missing seconds for --watch" << std::endl;
				return EXIT_CONFIG;
			}
			char *end = nullptr;
			watchSeconds = std::strtod(extra[++i].c_str(), &end);
			if (!end || *end != '\0' || watchSeconds < 0.0)
			{
				std::cerr << "Invalid --watch value: " << extra[i] << std::endl;
				return EXIT_CONFIG;
			}
		}
		else
		{
			std::cerr << "Unknown argument: " << extra[i] << std::endl;
			printUsage(argv[0]);
			return EXIT_CONFIG;
		}
	}

	ArdourOsc::Status valid = config.validate();
	if (!valid)
	{
		std::cerr << "Invalid configuration: " << valid.message() << std::endl;
		return EXIT_CONFIG;
	}

	log_level_t level = LOG_INFO;
	log_level_from_string(config.logLevel.c_str(), &level);
	if (log_init(config.logFile.empty() ? nullptr : config.logFile.c_str(), 0, nullptr) != 0)
	{
		std::cerr << "Cannot open log file " << config.logFile << std::endl;
		return EXIT_CONFIG;
	}
	log_set_level(level);

	signal(SIGINT, signal_handler);

	int exitCode = 0;
	{
		ArdourOsc::OscBridge bridge(config);

		ArdourOsc::Status connected = bridge.connect();
		if (!connected)
		{
			std::cerr << "Connect failed: " << connected.toString() << std::endl;
			log_cleanup();
			return EXIT_CONNECTION;
		}

		if (!sendAddress.empty())
		{
			ArdourOsc::Status sent = bridge.send(sendAddress, sendArgs);
			if (!sent)
			{
				std::cerr << "Send failed: " << sent.toString() << std::endl;
				exitCode = EXIT_SEND;
			}
		}

		if (exitCode == 0 && watchSeconds > 0.0)
		{
			auto deadline = std::chrono::steady_clock::now() +
							std::chrono::milliseconds(static_cast<long long>(watchSeconds * 1000.0));
			while (g_running && std::chrono::steady_clock::now() < deadline)
				std::this_thread::sleep_for(std::chrono::milliseconds(50));
		}

		std::cout << ArdourOsc::StateSerializer::toJson(bridge.getSessionState()).dump(2) << std::endl;

		ArdourOsc::ListenerStats stats = bridge.listenerStats();
		log_info("Feedback: %llu received, %llu decoded, %llu malformed, %llu unhandled",
				 static_cast<unsigned long long>(stats.received), static_cast<unsigned long long>(stats.decoded),
				 static_cast<unsigned long long>(stats.protocolErrors), static_cast<unsigned long long>(stats.unhandled));

		bridge.disconnect();
	}

	log_cleanup();
	return exitCode;
}
