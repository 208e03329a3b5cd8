#include "ArdourOsc/HandlerRegistry.h"

#include <climits>
#include <cmath>
#include <cstdlib>
#include <unordered_map>

#include "ArdourOsc/Logging.h"

namespace ArdourOsc {
    namespace {
        const char STRIP_PREFIX[] = "/strip/";

        /**
         * Argument view handed to the built-in handlers. For per strip entries
         * the strip id has already been taken from the first argument and
         * index 0 is the first argument after it.
         */
        class FeedbackArgs {
           public:
            FeedbackArgs(const std::vector<Value> &args, size_t offset, int strip)
                : args_(args), offset_(offset), strip_(strip) {}

            int strip() const { return strip_; }

            size_t size() const { return args_.size() > offset_ ? args_.size() - offset_ : 0; }

            bool has(size_t i) const { return i < size(); }

            std::optional<int64_t> integer(size_t i) const {
                if (!has(i)) return std::nullopt;
                const Value &v = args_[offset_ + i];
                if (v.isFloat() || v.isDouble()) {
                    double d = *v.toDouble();
                    if (!std::isfinite(d)) return std::nullopt;
                    return static_cast<int64_t>(std::llround(d));
                }
                return v.toInteger();
            }

            std::optional<int> int32(size_t i) const {
                std::optional<int64_t> value = integer(i);
                if (!value || *value < INT_MIN || *value > INT_MAX) return std::nullopt;
                return static_cast<int>(*value);
            }

            std::optional<float> number(size_t i) const {
                if (!has(i)) return std::nullopt;
                std::optional<double> value = args_[offset_ + i].toDouble();
                if (!value || std::isnan(*value)) return std::nullopt;
                return static_cast<float>(*value);
            }

            std::optional<double> real(size_t i) const {
                if (!has(i)) return std::nullopt;
                std::optional<double> value = args_[offset_ + i].toDouble();
                if (!value || std::isnan(*value)) return std::nullopt;
                return value;
            }

            std::optional<bool> flag(size_t i) const {
                std::optional<double> value = real(i);
                if (!value) return std::nullopt;
                return *value != 0.0;
            }

            const std::string *text(size_t i) const {
                if (!has(i) || !args_[offset_ + i].isString()) return nullptr;
                return &args_[offset_ + i].asString();
            }

           private:
            const std::vector<Value> &args_;
            size_t offset_;
            int strip_;
        };

        enum class Scope { Session, Strip };

        using ApplyFn = bool (*)(StateStore &, const FeedbackArgs &);

        struct BuiltinHandler {
            const char *address;
            Scope scope;
            ApplyFn apply;
        };

        std::optional<MeterLevels> meterFrom(const FeedbackArgs &a) {
            std::optional<float> peakLeft = a.number(0);
            if (!peakLeft) return std::nullopt;

            MeterLevels meter;
            meter.peakLeft = *peakLeft;
            meter.peakRight = a.number(1).value_or(meter.peakLeft);
            meter.rmsLeft = a.number(2).value_or(meter.peakLeft);
            meter.rmsRight = a.number(3).value_or(meter.rmsLeft);
            return meter;
        }

        bool setAutomation(StateStore &s, const FeedbackArgs &a, const char *parameter) {
            std::optional<int64_t> raw = a.integer(0);
            if (!raw) return false;
            std::optional<AutomationMode> mode = automationModeFromInt(*raw);
            if (!mode) return false;
            s.setAutomationMode(a.strip(), parameter, *mode);
            return true;
        }

        const BuiltinHandler kBuiltinHandlers[] = {
            // Transport
            {"/transport_frame", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<int64_t> frame = a.integer(0);
                 if (!frame) return false;
                 TransportUpdate u;
                 u.frame = *frame;
                 s.updateTransport(u);
                 return true;
             }},
            {"/transport_speed", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<double> speed = a.real(0);
                 if (!speed) return false;
                 TransportUpdate u;
                 u.speed = *speed;
                 u.playing = *speed != 0.0;
                 s.updateTransport(u);
                 return true;
             }},
            {"/transport_play", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 TransportUpdate u;
                 if (a.has(0)) {
                     std::optional<bool> on = a.flag(0);
                     if (!on) return false;
                     u.playing = *on;
                 } else {
                     u.playing = true;
                 }
                 s.updateTransport(u);
                 return true;
             }},
            {"/transport_stop", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 if (a.has(0)) {
                     std::optional<bool> on = a.flag(0);
                     if (!on) return false;
                     if (!*on) return true;
                 }
                 TransportUpdate u;
                 u.playing = false;
                 s.updateTransport(u);
                 return true;
             }},
            {"/record_enabled", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<bool> on = a.flag(0);
                 if (!on) return false;
                 TransportUpdate u;
                 u.recording = *on;
                 s.updateTransport(u);
                 return true;
             }},
            {"/rec_enable_toggle", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<bool> on = a.flag(0);
                 if (!on) return false;
                 TransportUpdate u;
                 u.recording = *on;
                 s.updateTransport(u);
                 return true;
             }},
            {"/tempo", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<double> bpm = a.real(0);
                 if (!bpm || *bpm <= 0.0) return false;
                 TransportUpdate u;
                 u.tempo = *bpm;
                 s.updateTransport(u);
                 return true;
             }},
            {"/time_signature", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<int> numerator = a.int32(0);
                 std::optional<int> denominator = a.int32(1);
                 if (!numerator || !denominator || *numerator <= 0 || *denominator <= 0) {
                     return false;
                 }
                 TransportUpdate u;
                 u.timeSignature = std::make_pair(*numerator, *denominator);
                 s.updateTransport(u);
                 return true;
             }},
            {"/loop_toggle", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<bool> on = a.flag(0);
                 if (!on) return false;
                 TransportUpdate u;
                 u.loopEnabled = *on;
                 s.updateTransport(u);
                 return true;
             }},
            {"/loop_range", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<int64_t> start = a.integer(0);
                 std::optional<int64_t> end = a.integer(1);
                 if (!start || !end) return false;
                 TransportUpdate u;
                 u.loopRange = std::make_pair(*start, *end);
                 s.updateTransport(u);
                 return true;
             }},

            // Session
            {"/session_name", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 const std::string *name = a.text(0);
                 if (!name) return false;
                 SessionUpdate u;
                 u.name = *name;
                 s.updateSession(u);
                 return true;
             }},
            {"/session_path", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 const std::string *path = a.text(0);
                 if (!path) return false;
                 SessionUpdate u;
                 u.path = *path;
                 s.updateSession(u);
                 return true;
             }},
            {"/sample_rate", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<int> rate = a.int32(0);
                 if (!rate || *rate <= 0) return false;
                 SessionUpdate u;
                 u.sampleRate = *rate;
                 s.updateSession(u);
                 return true;
             }},
            {"/track_count", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<int> count = a.int32(0);
                 if (!count || *count < 0) return false;
                 SessionUpdate u;
                 u.trackCount = *count;
                 s.updateSession(u);
                 return true;
             }},
            {"/dirty", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<bool> dirty = a.flag(0);
                 if (!dirty) return false;
                 SessionUpdate u;
                 u.dirty = *dirty;
                 s.updateSession(u);
                 return true;
             }},
            {"/master/meter", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<MeterLevels> meter = meterFrom(a);
                 if (!meter) return false;
                 SessionUpdate u;
                 u.masterMeter = *meter;
                 s.updateSession(u);
                 return true;
             }},

            // Markers
            {"/add_marker", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 const std::string *name = a.text(0);
                 if (!name) return false;
                 s.upsertMarker(*name, a.integer(1).value_or(0));
                 return true;
             }},
            {"/marker", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 const std::string *name = a.text(0);
                 if (!name) return false;
                 s.upsertMarker(*name, a.integer(1).value_or(0));
                 return true;
             }},
            {"/remove_marker", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 const std::string *name = a.text(0);
                 if (!name) return false;
                 s.removeMarker(*name);
                 return true;
             }},
            {"/marker/position", Scope::Session,
             [](StateStore &s, const FeedbackArgs &a) {
                 const std::string *name = a.text(0);
                 std::optional<int64_t> position = a.integer(1);
                 if (!name || !position) return false;
                 s.upsertMarker(*name, *position);
                 return true;
             }},

            // Strips, first argument is the strip id
            {"/strip/name", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 const std::string *name = a.text(0);
                 if (!name) return false;
                 TrackUpdate u;
                 u.name = *name;
                 s.updateTrack(a.strip(), u);
                 return true;
             }},
            {"/strip/gain", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<float> gain = a.number(0);
                 if (!gain) return false;
                 TrackUpdate u;
                 u.gainDb = *gain;
                 s.updateTrack(a.strip(), u);
                 return true;
             }},
            {"/strip/pan_stereo_position", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<float> pan = a.number(0);
                 if (!pan) return false;
                 TrackUpdate u;
                 u.pan = *pan;
                 s.updateTrack(a.strip(), u);
                 return true;
             }},
            {"/strip/mute", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<bool> on = a.flag(0);
                 if (!on) return false;
                 TrackUpdate u;
                 u.muted = *on;
                 s.updateTrack(a.strip(), u);
                 return true;
             }},
            {"/strip/solo", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<bool> on = a.flag(0);
                 if (!on) return false;
                 TrackUpdate u;
                 u.soloed = *on;
                 s.updateTrack(a.strip(), u);
                 return true;
             }},
            {"/strip/recenable", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<bool> on = a.flag(0);
                 if (!on) return false;
                 TrackUpdate u;
                 u.recEnabled = *on;
                 s.updateTrack(a.strip(), u);
                 return true;
             }},
            {"/strip/select", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<bool> on = a.flag(0);
                 if (!on) return false;
                 TrackUpdate u;
                 u.selected = *on;
                 s.updateTrack(a.strip(), u);
                 return true;
             }},
            {"/strip/monitor_input", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<bool> on = a.flag(0);
                 if (!on) return false;
                 s.setTrackMonitor(a.strip(), MonitorMode::Input, *on);
                 return true;
             }},
            {"/strip/monitor_disk", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<bool> on = a.flag(0);
                 if (!on) return false;
                 s.setTrackMonitor(a.strip(), MonitorMode::Disk, *on);
                 return true;
             }},
            {"/strip/meter", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<MeterLevels> meter = meterFrom(a);
                 if (!meter) return false;
                 TrackUpdate u;
                 u.meter = *meter;
                 s.updateTrack(a.strip(), u);
                 return true;
             }},
            {"/strip/automation_mode", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) { return setAutomation(s, a, "all"); }},
            {"/strip/gain/automation_mode", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) { return setAutomation(s, a, "gain"); }},
            {"/strip/pan/automation_mode", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) { return setAutomation(s, a, "pan"); }},
            {"/strip/mute/automation_mode", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) { return setAutomation(s, a, "mute"); }},
            {"/strip/trim/automation_mode", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) { return setAutomation(s, a, "trim"); }},
            {"/strip/send/gain", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<int> send = a.int32(0);
                 std::optional<float> gain = a.number(1);
                 if (!send || !gain) return false;
                 s.updateSend(a.strip(), *send, gain, std::nullopt);
                 return true;
             }},
            {"/strip/send/enable", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<int> send = a.int32(0);
                 std::optional<bool> on = a.flag(1);
                 if (!send || !on) return false;
                 s.updateSend(a.strip(), *send, std::nullopt, on);
                 return true;
             }},
            {"/strip/plugin/parameter", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<int> plugin = a.int32(0);
                 std::optional<int> parameter = a.int32(1);
                 std::optional<float> value = a.number(2);
                 if (!plugin || !parameter || !value) return false;
                 s.setPluginParameter(a.strip(), *plugin, *parameter, *value);
                 return true;
             }},
            {"/strip/plugin/activate", Scope::Strip,
             [](StateStore &s, const FeedbackArgs &a) {
                 std::optional<int> plugin = a.int32(0);
                 std::optional<bool> on = a.flag(1);
                 if (!plugin || !on) return false;
                 s.setPluginActive(a.strip(), *plugin, *on);
                 return true;
             }},
        };

        const std::unordered_map<std::string, const BuiltinHandler *> &builtinIndex() {
            static const std::unordered_map<std::string, const BuiltinHandler *> index = [] {
                std::unordered_map<std::string, const BuiltinHandler *> result;
                for (const auto &entry : kBuiltinHandlers) {
                    result.emplace(entry.address, &entry);
                }
                return result;
            }();
            return index;
        }

        const BuiltinHandler *findBuiltin(const std::string &address) {
            const auto &index = builtinIndex();
            auto it = index.find(address);
            return it == index.end() ? nullptr : it->second;
        }
    }  // namespace

    HandlerRegistry::HandlerRegistry(StateStore &store) : m_store(store) {}

    HandlerRegistry::Result HandlerRegistry::dispatch(const Message &message) {
        const std::string &address = message.getPath();
        const std::vector<Value> &args = message.getArguments();

        Result result = applyBuiltin(address, args);
        bool extended = runExtensions(address, args);

        if (result == Result::Unhandled && extended) {
            result = Result::Handled;
        }

        switch (result) {
            case Result::Handled:
                ++m_handled;
                break;
            case Result::Unhandled:
                ++m_unhandled;
                log_debug("No handler for feedback %s", address.c_str());
                break;
            case Result::Rejected:
                ++m_rejected;
                log_debug("Ignoring feedback %s with unusable arguments ,%s", address.c_str(),
                          message.getTypeTags().c_str());
                break;
        }
        return result;
    }

    HandlerRegistry::Result HandlerRegistry::applyBuiltin(const std::string &address,
                                                          const std::vector<Value> &args) {
        const BuiltinHandler *handler = findBuiltin(address);
        if (handler) {
            if (handler->scope == Scope::Session) {
                return handler->apply(m_store, FeedbackArgs(args, 0, 0)) ? Result::Handled
                                                                          : Result::Rejected;
            }

            if (args.empty()) {
                return Result::Rejected;
            }
            std::optional<int64_t> strip = args[0].toInteger();
            if (!strip || *strip < 0 || *strip > INT_MAX) {
                return Result::Rejected;
            }
            return handler->apply(m_store, FeedbackArgs(args, 1, static_cast<int>(*strip)))
                       ? Result::Handled
                       : Result::Rejected;
        }

        std::string canonical;
        int strip = 0;
        if (splitPathId(address, canonical, strip)) {
            handler = findBuiltin(canonical);
            if (handler && handler->scope == Scope::Strip) {
                return handler->apply(m_store, FeedbackArgs(args, 0, strip)) ? Result::Handled
                                                                              : Result::Rejected;
            }
        }

        return Result::Unhandled;
    }

    bool HandlerRegistry::runExtensions(const std::string &address,
                                        const std::vector<Value> &args) {
        std::vector<FeedbackHandler> matched;
        {
            std::lock_guard<std::mutex> lock(m_extensionMutex);
            for (const auto &extension : m_extensions) {
                bool matches = extension.prefix
                                   ? address.compare(0, extension.pattern.size(),
                                                     extension.pattern) == 0
                                   : address == extension.pattern;
                if (matches) {
                    matched.push_back(extension.handler);
                }
            }
        }

        // Handlers run outside the lock so they may register further handlers.
        for (const auto &handler : matched) {
            handler(address, args);
        }
        return !matched.empty();
    }

    void HandlerRegistry::registerHandler(const std::string &pattern, FeedbackHandler handler) {
        if (!handler) {
            return;
        }

        Extension extension;
        extension.prefix = !pattern.empty() && pattern.back() == '*';
        extension.pattern = extension.prefix ? pattern.substr(0, pattern.size() - 1) : pattern;
        extension.handler = std::move(handler);

        std::lock_guard<std::mutex> lock(m_extensionMutex);
        m_extensions.push_back(std::move(extension));
    }

    size_t HandlerRegistry::extensionHandlerCount() const {
        std::lock_guard<std::mutex> lock(m_extensionMutex);
        return m_extensions.size();
    }

    HandlerRegistry::Stats HandlerRegistry::stats() const {
        Stats s;
        s.handled = m_handled.load();
        s.unhandled = m_unhandled.load();
        s.rejected = m_rejected.load();
        return s;
    }

    void HandlerRegistry::resetStats() {
        m_handled = 0;
        m_unhandled = 0;
        m_rejected = 0;
    }

    bool HandlerRegistry::hasBuiltin(const std::string &address) {
        if (findBuiltin(address)) {
            return true;
        }
        std::string canonical;
        int strip = 0;
        if (!splitPathId(address, canonical, strip)) {
            return false;
        }
        const BuiltinHandler *handler = findBuiltin(canonical);
        return handler && handler->scope == Scope::Strip;
    }

    std::vector<std::string> HandlerRegistry::builtinAddresses() {
        std::vector<std::string> addresses;
        for (const auto &entry : kBuiltinHandlers) {
            addresses.emplace_back(entry.address);
        }
        return addresses;
    }

    bool HandlerRegistry::splitPathId(const std::string &address, std::string &canonical,
                                      int &id) {
        const size_t prefixLength = sizeof(STRIP_PREFIX) - 1;
        if (address.compare(0, prefixLength, STRIP_PREFIX) != 0) {
            return false;
        }

        size_t end = address.find('/', prefixLength);
        if (end == std::string::npos || end == prefixLength || end + 1 >= address.size()) {
            return false;
        }

        std::string segment = address.substr(prefixLength, end - prefixLength);
        if (segment.size() > 9) {
            return false;
        }
        for (char c : segment) {
            if (c < '0' || c > '9') {
                return false;
            }
        }

        id = std::atoi(segment.c_str());
        canonical = std::string(STRIP_PREFIX) + address.substr(end + 1);
        return true;
    }

}  // namespace ArdourOsc
