//! # Diagnostics
//!
//! User-facing errors and warnings produced by lowering, and the text
//! renderer that shows them against their source.
//!
//! ## Error Code Categories
//!
//! | Prefix | Category    | Example                         |
//! |--------|-------------|---------------------------------|
//! | T      | Type check  | T001 - Type mismatch            |
//! | W      | Warning     | W001 - Unreachable code         |
//!
//! The lowering core never writes to a stream: it returns `Diagnostic`
//! values. Rendering is the job of `DiagnosticEmitter`, which resolves byte
//! spans to lines and columns through a `SourceFiles` registry.

#pragma once

#include "common.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace spark::diag {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

// ============================================================================
// Error Codes
// ============================================================================

namespace ErrorCodes {
constexpr const char* TYPE_MISMATCH = "T001";
constexpr const char* TYPE_UNKNOWN = "T002";
constexpr const char* ARG_COUNT_MISMATCH = "T004";
constexpr const char* FIELD_UNKNOWN = "T005";
constexpr const char* CANNOT_INFER = "T007";
constexpr const char* DUPLICATE_DEF = "T008";
constexpr const char* UNDECLARED_IDENT = "T009";
constexpr const char* NOT_CALLABLE = "T010";
constexpr const char* INVALID_CAST = "T011";
constexpr const char* MISSING_RETURN = "T012";

constexpr const char* UNREACHABLE_CODE = "W001";
} // namespace ErrorCodes

// ============================================================================
// Diagnostic Message
// ============================================================================

enum class Severity {
    Error,
    Warning,
    Note,
    Help,
};

enum class LabelStyle {
    Primary,   ///< The location of the problem, underlined with ^^^
    Secondary, ///< Related context, underlined with ---
};

/// A message attached to a source range.
struct Label {
    LabelStyle style;
    FileId file;
    Span span;
    std::string message;

    [[nodiscard]] static auto primary(FileId file, Span span, std::string message = {}) -> Label;
    [[nodiscard]] static auto secondary(FileId file, Span span, std::string message = {})
        -> Label;

    [[nodiscard]] auto is_primary() const -> bool {
        return style == LabelStyle::Primary;
    }
};

struct Diagnostic {
    Severity severity = Severity::Error;
    std::string code;    ///< Error code (e.g., "T001")
    std::string message; ///< Main message
    std::vector<Label> labels;
    std::vector<std::string> notes;
    std::vector<std::string> help;

    [[nodiscard]] static auto error(std::string code, std::string message) -> Diagnostic;
    [[nodiscard]] static auto warning(std::string code, std::string message) -> Diagnostic;

    auto with_label(Label label) -> Diagnostic&;
    auto with_note(std::string note) -> Diagnostic&;
    auto with_help(std::string text) -> Diagnostic&;

    [[nodiscard]] auto is_error() const -> bool {
        return severity == Severity::Error;
    }

    /// The first primary label, if any.
    [[nodiscard]] auto primary_label() const -> const Label*;
};

// ============================================================================
// Source Files
// ============================================================================

/// 1-based line and column of a byte offset.
struct SourceLocation {
    uint32_t line = 1;
    uint32_t column = 1;
};

/// Registry of source texts addressed by `FileId`.
class SourceFiles {
public:
    auto add(std::string name, std::string content) -> FileId;

    [[nodiscard]] auto name(FileId file) const -> const std::string&;
    [[nodiscard]] auto content(FileId file) const -> const std::string&;

    /// Line and column of `offset`; offsets past the end clamp to the end.
    [[nodiscard]] auto location(FileId file, uint32_t offset) const -> SourceLocation;

    /// Text of a 1-based line without its newline; empty if out of range.
    [[nodiscard]] auto line_text(FileId file, uint32_t line) const -> std::string;

    [[nodiscard]] auto size() const -> size_t {
        return files_.size();
    }

private:
    struct File {
        std::string name;
        std::string content;
        std::vector<uint32_t> line_starts;
    };

    [[nodiscard]] auto get(FileId file) const -> const File&;

    std::vector<File> files_;
};

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(const SourceFiles& files, std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }

    void emit(const Diagnostic& diag);
    void emit_all(const std::vector<Diagnostic>& diags);

    [[nodiscard]] auto error_count() const -> size_t {
        return error_count_;
    }
    [[nodiscard]] auto warning_count() const -> size_t {
        return warning_count_;
    }

private:
    const SourceFiles& files_;
    std::ostream& out_;
    bool use_colors_ = true;
    size_t error_count_ = 0;
    size_t warning_count_ = 0;

    auto color(const char* code) const -> const char* {
        return use_colors_ ? code : "";
    }

    void emit_header(const Diagnostic& diag);
    void emit_snippet(const Diagnostic& diag);
    void emit_labeled_line(FileId file, uint32_t line, const std::vector<const Label*>& labels,
                           int line_width);
    void emit_trailer(const Diagnostic& diag);
};

/// Checks whether stderr is a color-capable terminal.
[[nodiscard]] auto terminal_supports_colors() -> bool;

[[nodiscard]] auto severity_name(Severity sev) -> const char*;

// ============================================================================
// "Did You Mean?" Suggestions
// ============================================================================

/// Case-insensitive edit distance.
[[nodiscard]] auto levenshtein_distance(const std::string& a, const std::string& b) -> size_t;

/// The candidate closest to `input` within `max_distance` edits, or an empty
/// string if there is none.
[[nodiscard]] auto find_similar(const std::string& input,
                                const std::vector<std::string>& candidates,
                                size_t max_distance = 2) -> std::string;

} // namespace spark::diag
