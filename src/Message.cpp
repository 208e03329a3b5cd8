#include "ArdourOsc/Message.h"

#include <sstream>

namespace ArdourOsc {
    bool Message::isValidAddress(const std::string &address) {
        if (address.empty() || address[0] != '/') {
            return false;
        }

        for (char c : address) {
            auto uc = static_cast<unsigned char>(c);
            if (uc <= 0x20 || uc == 0x7f || c == '#') {
                return false;
            }
        }
        return true;
    }

    std::string Message::toString() const {
        std::ostringstream out;
        out << path_ << " ," << getTypeTags();
        for (const auto &arg : arguments_) {
            out << ' ' << arg.toString();
        }
        return out.str();
    }

}  // namespace ArdourOsc
