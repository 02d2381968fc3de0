//! # Diagnostic Model and Source Registry

#include "diag/diagnostic.hpp"

#include <algorithm>
#include <cctype>

namespace spark::diag {

// ============================================================================
// Labels and Diagnostics
// ============================================================================

auto Label::primary(FileId file, Span span, std::string message) -> Label {
    return Label{LabelStyle::Primary, file, span, std::move(message)};
}

auto Label::secondary(FileId file, Span span, std::string message) -> Label {
    return Label{LabelStyle::Secondary, file, span, std::move(message)};
}

auto Diagnostic::error(std::string code, std::string message) -> Diagnostic {
    Diagnostic diag;
    diag.severity = Severity::Error;
    diag.code = std::move(code);
    diag.message = std::move(message);
    return diag;
}

auto Diagnostic::warning(std::string code, std::string message) -> Diagnostic {
    Diagnostic diag;
    diag.severity = Severity::Warning;
    diag.code = std::move(code);
    diag.message = std::move(message);
    return diag;
}

auto Diagnostic::with_label(Label label) -> Diagnostic& {
    labels.push_back(std::move(label));
    return *this;
}

auto Diagnostic::with_note(std::string note) -> Diagnostic& {
    notes.push_back(std::move(note));
    return *this;
}

auto Diagnostic::with_help(std::string text) -> Diagnostic& {
    help.push_back(std::move(text));
    return *this;
}

auto Diagnostic::primary_label() const -> const Label* {
    for (const auto& label : labels) {
        if (label.is_primary()) {
            return &label;
        }
    }
    return nullptr;
}

auto severity_name(Severity sev) -> const char* {
    switch (sev) {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Note:
        return "note";
    case Severity::Help:
        return "help";
    }
    return "unknown";
}

// ============================================================================
// Source Files
// ============================================================================

auto SourceFiles::add(std::string name, std::string content) -> FileId {
    File file{std::move(name), std::move(content), {0}};
    for (uint32_t i = 0; i < file.content.size(); ++i) {
        if (file.content[i] == '\n') {
            file.line_starts.push_back(i + 1);
        }
    }
    files_.push_back(std::move(file));
    return static_cast<FileId>(files_.size() - 1);
}

auto SourceFiles::get(FileId file) const -> const File& {
    if (file >= files_.size()) {
        internal_error("diag", "unknown source file id " + std::to_string(file));
    }
    return files_[file];
}

auto SourceFiles::name(FileId file) const -> const std::string& {
    return get(file).name;
}

auto SourceFiles::content(FileId file) const -> const std::string& {
    return get(file).content;
}

auto SourceFiles::location(FileId file, uint32_t offset) const -> SourceLocation {
    const File& f = get(file);
    offset = std::min(offset, static_cast<uint32_t>(f.content.size()));

    // Last line start not after `offset`.
    auto it = std::upper_bound(f.line_starts.begin(), f.line_starts.end(), offset);
    auto line_index = static_cast<uint32_t>(std::distance(f.line_starts.begin(), it) - 1);
    return SourceLocation{line_index + 1, offset - f.line_starts[line_index] + 1};
}

auto SourceFiles::line_text(FileId file, uint32_t line) const -> std::string {
    const File& f = get(file);
    if (line == 0 || line > f.line_starts.size()) {
        return "";
    }
    uint32_t start = f.line_starts[line - 1];
    size_t end = f.content.find('\n', start);
    if (end == std::string::npos) {
        end = f.content.size();
    }
    return f.content.substr(start, end - start);
}

// ============================================================================
// Suggestions
// ============================================================================

auto levenshtein_distance(const std::string& a, const std::string& b) -> size_t {
    if (a.empty())
        return b.size();
    if (b.empty())
        return a.size();

    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) {
        prev[j] = j;
    }

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            auto ca = std::tolower(static_cast<unsigned char>(a[i - 1]));
            auto cb = std::tolower(static_cast<unsigned char>(b[j - 1]));
            size_t cost = ca == cb ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

auto find_similar(const std::string& input, const std::vector<std::string>& candidates,
                  size_t max_distance) -> std::string {
    std::string best;
    size_t best_distance = max_distance + 1;

    for (const auto& candidate : candidates) {
        if (candidate == input) {
            continue;
        }
        size_t len_diff = input.size() > candidate.size() ? input.size() - candidate.size()
                                                          : candidate.size() - input.size();
        if (len_diff > max_distance) {
            continue;
        }
        size_t dist = levenshtein_distance(input, candidate);
        if (dist < best_distance) {
            best_distance = dist;
            best = candidate;
        }
    }
    return best;
}

} // namespace spark::diag
