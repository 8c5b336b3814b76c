#include "engine/Diagnostic.h"
#include "engine/Engine.h"
#include <string>
#include <string_view>
#include <unistd.h>

namespace pyspect {
    static void write_str(const std::string_view strView) {
        std::size_t done = 0;
        while (done < strView.size()) {
            const auto n = ::write(2, strView.data() + done, strView.size() - done);
            if (n <= 0) { return; }
            done += static_cast<std::size_t>(n);
        }
    }

    static void write_int(const int value) { write_str(std::to_string(value)); }

    // ANSI fragments
    static constexpr std::string_view kMagenta = "\033[35m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_header(const Diagnostic &diag, const bool color) {
        if (diag.file.empty()) { return; }
        if (color) { write_str(kBold); }
        write_str(diag.file);
        if (diag.line > 0) {
            write_str(":");
            write_int(diag.line);
            if (diag.col > 0) {
                write_str(":");
                write_int(diag.col);
            }
        }
        write_str(": ");
        if (color) { write_str(kReset); }
    }

    static void print_label(const bool color) {
        if (color) {
            write_str(kMagenta);
            write_str("warning: ");
            write_str(kReset);
        } else { write_str("warning: "); }
    }

    // Line N of the in-memory text, without its terminator.
    static bool source_line(const std::string_view text, const int line, std::string_view &out) {
        std::size_t start = 0;
        for (int cur = 1; cur < line; ++cur) {
            const auto nl = text.find('\n', start);
            if (nl == std::string_view::npos) { return false; }
            start = nl + 1;
        }
        if (start >= text.size()) { return false; }
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) { end = text.size(); }
        if (end > start && text[end - 1] == '\r') { --end; }
        out = text.substr(start, end - start);
        return true;
    }

    static void print_source_with_caret(const Diagnostic &diag, const std::string_view sourceText) {
        if (diag.line <= 0 || diag.col <= 0) { return; }
        std::string_view lineStr;
        if (!source_line(sourceText, diag.line, lineStr)) { return; }
        write_str("  ");
        write_str(lineStr);
        write_str("\n");
        write_str("  ");
        for (int i = 1; i < diag.col; ++i) { write_str(" "); }
        write_str("^\n");
    }

    void Engine::print_diagnostic(const Diagnostic &diag, const bool color, const std::string_view sourceText) {
        print_header(diag, color);
        print_label(color);
        write_str(diag.kind);
        write_str(": ");
        write_str(diag.message);
        write_str("\n");
        print_source_with_caret(diag, sourceText);
    }
} // namespace pyspect
