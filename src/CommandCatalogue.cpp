#include "ArdourOsc/CommandCatalogue.h"

#include <cmath>
#include <limits>

#include "ArdourOsc/Exceptions.h"
#include "ArdourOsc/Message.h"

namespace ArdourOsc {
    const std::vector<CommandSpec> &CommandCatalogue::entries() {
        static const std::vector<CommandSpec> table = {
            // Transport
            {"/transport_play", {""}, "Start playback"},
            {"/transport_stop", {""}, "Stop playback"},
            {"/toggle_roll", {""}, "Toggle between play and stop"},
            {"/rec_enable_toggle", {""}, "Toggle global record arm"},
            {"/goto_start", {""}, "Move the playhead to the session start"},
            {"/goto_end", {""}, "Move the playhead to the session end"},
            {"/loop_toggle", {""}, "Toggle loop playback"},
            {"/transport_speed", {"f"}, "Set transport speed (1.0 = normal)"},
            {"/locate", {"hi", "s"}, "Locate to a sample position (roll flag) or a marker"},
            {"/set_loop_range", {"hh"}, "Set loop start and end in samples"},
            {"/set_tempo", {"f"}, "Set tempo in BPM"},
            {"/set_time_signature", {"ii"}, "Set time signature numerator and denominator"},
            {"/set_punch_in", {"i"}, "Enable or disable punch in"},
            {"/set_punch_out", {"i"}, "Enable or disable punch out"},

            // Session
            {"/save_state", {""}, "Save the session"},
            {"/refresh", {""}, "Ask the application to resend all feedback"},
            {"/undo", {""}, "Undo the last operation"},
            {"/redo", {""}, "Redo the last undone operation"},
            {"/add_marker", {"", "s"}, "Add a marker at the playhead"},
            {"/remove_marker", {"", "s"}, "Remove the marker at the playhead or by name"},
            {"/add_audio_track", {"i", "is"}, "Add audio tracks (count, optional name)"},
            {"/add_midi_track", {"i", "is"}, "Add MIDI tracks (count, optional name)"},
            {"/set_surface/port", {"i"}, "Port the application sends feedback to"},
            {"/set_surface/feedback", {"i"}, "Feedback bitmask"},

            // Strips
            {"/strip/name", {"is"}, "Rename a strip"},
            {"/strip/gain", {"if"}, "Set strip gain in dB"},
            {"/strip/fader", {"if"}, "Set strip fader position (0..1)"},
            {"/strip/pan_stereo_position", {"if"}, "Set strip pan (-1..1)"},
            {"/strip/trimdB", {"if"}, "Set strip trim in dB"},
            {"/strip/mute", {"ii"}, "Mute or unmute a strip"},
            {"/strip/solo", {"ii"}, "Solo or unsolo a strip"},
            {"/strip/recenable", {"ii"}, "Arm or disarm a strip for recording"},
            {"/strip/monitor_input", {"ii"}, "Monitor input on a strip"},
            {"/strip/monitor_disk", {"ii"}, "Monitor disk on a strip"},
            {"/strip/select", {"ii"}, "Select or deselect a strip"},
            {"/strip/automation_mode", {"ii"}, "Set automation mode of all strip parameters"},
            {"/strip/gain/automation_mode", {"ii"}, "Set gain automation mode"},
            {"/strip/pan/automation_mode", {"ii"}, "Set pan automation mode"},
            {"/strip/mute/automation_mode", {"ii"}, "Set mute automation mode"},
            {"/strip/trim/automation_mode", {"ii"}, "Set trim automation mode"},
            {"/strip/send/gain", {"iif"}, "Set send gain in dB (strip, send, gain)"},
            {"/strip/send/enable", {"iii"}, "Enable or disable a send (strip, send, state)"},
            {"/strip/plugin/parameter", {"iiif"},
             "Set a plugin parameter (strip, plugin, parameter, value)"},
            {"/strip/plugin/activate", {"iii"}, "Activate or bypass a plugin (strip, plugin, state)"},
        };
        return table;
    }

    const CommandSpec *CommandCatalogue::find(const std::string &address) {
        for (const auto &entry : entries()) {
            if (address == entry.address) {
                return &entry;
            }
        }
        return nullptr;
    }

    std::vector<Value> CommandCatalogue::prepare(const std::string &address,
                                                 const std::vector<Value> &args) {
        if (!Message::isValidAddress(address)) {
            throw ValidationError("invalid OSC address '" + address + "'");
        }

        const CommandSpec *spec = find(address);
        if (!spec) {
            return args;
        }

        const std::string *signature = nullptr;
        for (const auto &candidate : spec->signatures) {
            if (candidate.size() == args.size()) {
                signature = &candidate;
                break;
            }
        }

        if (!signature) {
            std::string accepted;
            for (const auto &candidate : spec->signatures) {
                if (!accepted.empty()) accepted += ", ";
                accepted += "\"" + candidate + "\"";
            }
            throw ValidationError(address + " does not take " + std::to_string(args.size()) +
                                  " argument(s); accepted signatures: " + accepted);
        }

        std::vector<Value> prepared;
        prepared.reserve(args.size());
        for (size_t i = 0; i < args.size(); ++i) {
            prepared.push_back(coerce(address, i, (*signature)[i], args[i]));
        }
        return prepared;
    }

    Value CommandCatalogue::coerce(const std::string &address, size_t index, char tag,
                                   const Value &arg) {
        auto reject = [&](const char *wanted) -> ValidationError {
            return ValidationError(address + ": argument " + std::to_string(index) +
                                   " must be " + wanted + ", got " + arg.toString());
        };

        switch (tag) {
            case Value::INT32_TAG: {
                std::optional<int64_t> value = arg.toInteger();
                if (!value || *value < std::numeric_limits<int32_t>::min() ||
                    *value > std::numeric_limits<int32_t>::max()) {
                    throw reject("an int32");
                }
                return Value(static_cast<int32_t>(*value));
            }
            case Value::INT64_TAG: {
                std::optional<int64_t> value = arg.toInteger();
                if (!value) throw reject("an int64");
                return Value(static_cast<int64_t>(*value));
            }
            case Value::FLOAT_TAG: {
                std::optional<double> value = arg.toDouble();
                if (!value || !std::isfinite(*value)) throw reject("a finite float");
                return Value(static_cast<float>(*value));
            }
            case Value::DOUBLE_TAG: {
                std::optional<double> value = arg.toDouble();
                if (!value || !std::isfinite(*value)) throw reject("a finite double");
                return Value(*value);
            }
            case Value::STRING_TAG:
                if (!arg.isString()) throw reject("a string");
                return arg;
            case Value::BLOB_TAG:
                if (!arg.isBlob()) throw reject("a blob");
                return arg;
        }
        throw reject("a supported type");
    }

}  // namespace ArdourOsc
