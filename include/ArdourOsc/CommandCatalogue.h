/*
 *  ArdourOsc - OSC bridge for remote control of Ardour.
 *  This header declares the table of known command addresses and their
 *  accepted argument signatures.
 */

#pragma once

#include <string>
#include <vector>

#include "ArdourOsc/Value.h"

namespace ArdourOsc {
    /**
     * @brief One command address and the type tag strings it accepts
     */
    struct CommandSpec {
        const char *address;
        std::vector<std::string> signatures;
        const char *description;
    };

    /**
     * @brief Validates and coerces outgoing commands
     *
     * Known addresses select a signature by argument count and coerce each
     * numeric argument to the declared tag. Unknown addresses only get an
     * address syntax check, so any Ardour command can still be sent.
     */
    class CommandCatalogue {
       public:
        /**
         * @brief Look up a command
         * @return The entry, or nullptr for an address not in the table
         */
        static const CommandSpec *find(const std::string &address);

        static const std::vector<CommandSpec> &entries();

        /**
         * @brief Produce the argument list that goes on the wire
         *
         * @param address Command address
         * @param args Caller supplied arguments
         * @return Arguments coerced to the selected signature
         * @throws ValidationError for a bad address, an argument count no
         *         signature accepts, or an argument that cannot be coerced
         */
        static std::vector<Value> prepare(const std::string &address,
                                          const std::vector<Value> &args);

       private:
        static Value coerce(const std::string &address, size_t index, char tag, const Value &arg);
    };

}  // namespace ArdourOsc
