#ifndef STRATA_UTILS_TERMINAL_HPP
#define STRATA_UTILS_TERMINAL_HPP

#include <cstddef>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace Strata::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kRed           = "\033[31m";
        inline constexpr std::string_view kGreen         = "\033[32m";
        inline constexpr std::string_view kYellow        = "\033[33m";
        inline constexpr std::string_view kCyan          = "\033[36m";

        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";

        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
        inline constexpr std::string_view kGoldenrod    = "\033[38;5;221m";
    }

    namespace Styles {
        inline constexpr std::string_view kBold        = "\033[1m";
        inline constexpr std::string_view kDim         = "\033[2m";
    }

    namespace Symbols {
        inline constexpr std::string_view kCheck     = "✔";
        inline constexpr std::string_view kWarn      = "⚠";
        inline constexpr std::string_view kBoxHorizontal = "━";
    }

    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // "[Strata] " in the house colour. Every console line of the trainer starts with it.
    inline std::string Tag() {
        return ApplyColor("[Strata]", Colors::kTurquoise) + ' ';
    }

    inline void Info(std::ostream* stream, std::string_view message) {
        if (stream == nullptr) return;
        (*stream) << Tag() << message << std::endl;
    }

    inline void Warn(std::ostream* stream, std::string_view message) {
        if (stream == nullptr) return;
        (*stream) << Tag() << ApplyColor(std::string(Symbols::kWarn) + ' ' + std::string(message), Colors::kOrange)
                  << std::endl;
    }

    // ━━━ stage 2/7 (8x8) ━━━
    inline void Banner(std::ostream* stream, std::string_view title, std::size_t rule = 3) {
        if (stream == nullptr) return;
        const auto bar = Repeat(Symbols::kBoxHorizontal, rule);
        std::ostringstream line;
        line << bar << ' ' << title << ' ' << bar;
        (*stream) << '\n' << Tag()
                  << ApplyColor(std::string(Styles::kBold) + line.str(), Colors::kGoldenrod) << std::endl;
    }

    inline std::string Fixed(double value, int precision = 4) {
        std::ostringstream stream;
        stream << std::fixed << std::setprecision(precision) << value;
        return stream.str();
    }
}

#endif // STRATA_UTILS_TERMINAL_HPP
