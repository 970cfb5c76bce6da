#ifndef PASTICHE_TERMINAL_HPP
#define PASTICHE_TERMINAL_HPP

#include <ostream>
#include <string>
#include <string_view>

namespace Pastiche::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kRed           = "\033[31m";
        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightRed     = "\033[91m";
        inline constexpr std::string_view kBrightGreen   = "\033[92m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightCyan    = "\033[96m";
    }

    namespace Symbols {
        inline constexpr std::string_view kCheck = "✔";
        inline constexpr std::string_view kCross = "✘";
    }

    inline constexpr std::string_view kTag = "[Pastiche]";

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Writes one tagged line to `stream`; a null stream silences the call.
    inline void Log(std::ostream* stream, std::string_view message, std::string_view color = Colors::kBrightBlack) {
        if (stream == nullptr) {
            return;
        }
        *stream << ApplyColor(kTag, color) << ' ' << message << '\n';
        stream->flush();
    }
}

#endif // PASTICHE_TERMINAL_HPP
