//! # Diagnostic Emitter
//!
//! Renders diagnostics in the familiar compiler layout:
//!
//! ```text
//! error[T001]: Cannot apply binary operator + to operand types bool and i32
//!   --> main.sk:3:13
//!      |
//!    3 |     let x = true + 1
//!      |             ^^^^^^^^
//!      |             |
//!      |             LHS of type bool appears here
//!      |
//! ```

#include "diag/diagnostic.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <map>

#include <unistd.h>

namespace spark::diag {

auto terminal_supports_colors() -> bool {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;
    return std::string(term) != "dumb";
}

static auto severity_color(Severity sev) -> const char* {
    switch (sev) {
    case Severity::Error:
        return Colors::BrightRed;
    case Severity::Warning:
        return Colors::BrightYellow;
    case Severity::Note:
        return Colors::BrightCyan;
    case Severity::Help:
        return Colors::BrightGreen;
    }
    return Colors::Reset;
}

DiagnosticEmitter::DiagnosticEmitter(const SourceFiles& files, std::ostream& out)
    : files_(files), out_(out) {
    use_colors_ = terminal_supports_colors();
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    if (diag.severity == Severity::Error) {
        ++error_count_;
    } else if (diag.severity == Severity::Warning) {
        ++warning_count_;
    }

    emit_header(diag);
    emit_snippet(diag);
    emit_trailer(diag);
}

void DiagnosticEmitter::emit_all(const std::vector<Diagnostic>& diags) {
    for (const auto& diag : diags) {
        emit(diag);
    }
}

void DiagnosticEmitter::emit_header(const Diagnostic& diag) {
    out_ << color(Colors::Bold) << color(severity_color(diag.severity))
         << severity_name(diag.severity);
    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }
    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_snippet(const Diagnostic& diag) {
    const Label* anchor = diag.primary_label();
    if (!anchor && !diag.labels.empty()) {
        anchor = &diag.labels.front();
    }
    if (!anchor) {
        return;
    }

    SourceLocation loc = files_.location(anchor->file, anchor->span.from);
    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset)
         << files_.name(anchor->file) << ":" << loc.line << ":" << loc.column << "\n";

    // Labels in other files are listed by location only.
    std::map<uint32_t, std::vector<const Label*>> by_line;
    for (const auto& label : diag.labels) {
        if (label.file != anchor->file) {
            SourceLocation other = files_.location(label.file, label.span.from);
            out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset)
                 << files_.name(label.file) << ":" << other.line << ":" << other.column << " "
                 << label.message << "\n";
            continue;
        }
        by_line[files_.location(label.file, label.span.from).line].push_back(&label);
    }
    if (by_line.empty()) {
        return;
    }

    int line_width =
        std::max(static_cast<int>(std::to_string(by_line.rbegin()->first).length()), 4);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |"
         << color(Colors::Reset) << "\n";

    uint32_t prev_line = 0;
    for (const auto& [line, labels] : by_line) {
        if (prev_line > 0 && line > prev_line + 1) {
            out_ << color(Colors::BrightBlue) << std::setw(line_width - 1) << "" << "..."
                 << color(Colors::Reset) << "\n";
        }
        emit_labeled_line(anchor->file, line, labels, line_width);
        prev_line = line;
    }

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |"
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_labeled_line(FileId file, uint32_t line,
                                          const std::vector<const Label*>& labels,
                                          int line_width) {
    std::string source_line = files_.line_text(file, line);

    std::vector<const Label*> sorted = labels;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Label* a, const Label* b) {
        return a->span.from < b->span.from;
    });

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << line << " | "
         << color(Colors::Reset) << source_line << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
         << color(Colors::Reset);

    // Overlapping labels keep the first underline drawn at each column.
    size_t pos = 0;
    for (const auto* label : sorted) {
        SourceLocation start = files_.location(file, label->span.from);
        SourceLocation end = files_.location(file, label->span.to);
        size_t start_col = start.column - 1;
        size_t end_col = end.line == line ? end.column - 1 : source_line.size();
        end_col = std::max(end_col, start_col + 1);

        while (pos < start_col) {
            out_ << ' ';
            ++pos;
        }
        out_ << color(label->is_primary() ? Colors::BrightRed : Colors::BrightBlue);
        char underline = label->is_primary() ? '^' : '-';
        while (pos < end_col) {
            out_ << underline;
            ++pos;
        }
        out_ << color(Colors::Reset);
    }

    for (auto it = sorted.rbegin(); it != sorted.rend(); ++it) {
        if ((*it)->is_primary() && !(*it)->message.empty()) {
            out_ << " " << color(Colors::BrightRed) << (*it)->message << color(Colors::Reset);
            break;
        }
    }
    out_ << "\n";

    for (const auto* label : sorted) {
        if (label->is_primary() || label->message.empty()) {
            continue;
        }
        std::string pad(files_.location(file, label->span.from).column - 1, ' ');
        out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | " << pad << "|"
             << color(Colors::Reset) << "\n";
        out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | " << pad
             << label->message << color(Colors::Reset) << "\n";
    }
}

void DiagnosticEmitter::emit_trailer(const Diagnostic& diag) {
    for (const auto& note : diag.notes) {
        out_ << "  " << color(Colors::BrightCyan) << "= note" << color(Colors::Reset) << ": "
             << note << "\n";
    }
    for (const auto& text : diag.help) {
        out_ << "  " << color(Colors::BrightGreen) << "= help" << color(Colors::Reset) << ": "
             << text << "\n";
    }
    out_ << "\n";
}

} // namespace spark::diag
