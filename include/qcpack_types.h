#ifndef QCPACK_TYPES_H
#define QCPACK_TYPES_H

#include "qcpack.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/* ── corrections ───────────────────────────────────────────────── */

enum class CorrectionType { Misread, Missing, Inserted };

const char* correction_type_name(CorrectionType t);

struct Correction {
    std::string    id;
    int            page;        /* 1-based, as stated in the report */
    std::string    context;     /* searchable context phrase, never empty */
    std::string    note;        /* formatted note, role prefix included */
    std::string    track;
    std::string    timestamp;
    CorrectionType type;
    std::vector<std::string> words;   /* emphasis words, may be empty */
};

struct Classification {
    std::string    note;
    std::vector<std::string> words;
    CorrectionType type;
    std::string    context;
};

/* ── diagnostics ───────────────────────────────────────────────── */

enum class DiagKind {
    CorrectionDropped,
    PhraseNotLocated,
    PageOutOfRange,
    SuggestionRejected
};

const char* diag_kind_name(DiagKind k);

struct Diagnostic {
    DiagKind    kind;
    int         page;           /* 0 if not page-related */
    std::string id;             /* correction id, "" if none */
    std::string message;
};

struct Diagnostics {
    std::vector<Diagnostic> entries;
    qcpack_diag_callback    cb        = nullptr;
    void*                   user_data = nullptr;

    void   emit(DiagKind kind, int page, const std::string& id,
                const std::string& message);
    size_t count(DiagKind kind) const;
};

std::string diagnostic_json(const Diagnostic& d);

/* ── options ───────────────────────────────────────────────────── */

enum class Dialect { Standard, PostQc };

const char* dialect_name(Dialect d);

struct NotesBoxStyle {
    double margin      = 25.0;
    double font_size   = 10.0;
    double line_height = 13.0;
    double width_ratio = 0.4;
    double padding     = 8.0;
};

struct Options {
    bool                   audible          = false;
    std::optional<Dialect> dialect;          /* nullopt = detect from header */
    int                    page_offset      = 0;
    bool                   bridging         = true;
    bool                   aggressive_match = true;
    bool                   mark_audible     = false;
    double                 line_tolerance   = 5.0;
    std::string            gating_status    = "Fix Not Possible Without Pickup";
    std::vector<std::string> accepted_comments = {
        "pickup required", "pickup", "needs pickup",
        "fix not possible without pickup", "re-record"};
    NotesBoxStyle          notes_box;
};

/* Returns QCPACK_OK or QCPACK_ERR_BAD_CONFIG (message in *error). */
int         options_from_json(const std::string& text, Options& out,
                              std::string* error);
std::string options_to_json(const Options& opts);

/* ── text normalization ────────────────────────────────────────── */

std::u32string utf8_decode(const std::string& s);
std::string    utf8_encode(const std::u32string& s);
void           append_codepoint(std::string& s, char32_t cp);

/* indices[i] is the offset in the source string that produced text[i] */
struct NormalizedText {
    std::string           text;
    std::vector<uint32_t> indices;
};

std::string    normalize_text(const std::string& s);
NormalizedText normalize_with_map(const std::u32string& s);

/* bare lowercase alphanumerics, used by the aggressive matcher */
std::string    strip_to_alnum(const std::string& s);
NormalizedText strip_with_map(const std::u32string& s);

/* ── note classification ───────────────────────────────────────── */

Classification classify_note(const std::string& note,
                             const std::string& context, bool audible);

/* raw context with placeholder runs blanked and whitespace collapsed */
std::string searchable_context(const std::string& raw);

/* ── report rows ───────────────────────────────────────────────── */

using Row   = std::vector<std::string>;
using Table = std::vector<Row>;

struct ReportResult {
    int         status;         /* QCPACK_OK or a negative status code */
    std::string error;
    Dialect     dialect;
    std::vector<Correction> corrections;
};

int read_csv_rows(const void* buf, size_t len, Table& out, std::string* error);
int read_xlsx_rows(const void* buf, size_t len, Table& out, std::string* error);

/* Returns QCPACK_OK or QCPACK_ERR_UNSUPPORTED_DIALECT. */
int detect_dialect(const Table& rows, Dialect& out);

ReportResult extract_corrections(const Table& rows, Dialect dialect,
                                 const Options& opts, Diagnostics& diag);

/* CSV or XLSX bytes; dialect from opts or detected from the header. */
ReportResult parse_report(const void* buf, size_t len, const Options& opts,
                          Diagnostics& diag);

/* ── page text ─────────────────────────────────────────────────── */

/* Origin bottom-left, y up. y is the bottom of the run box. */
struct TextRun {
    std::string text;
    double      x, y, width, height;
};

struct CharRef {
    int32_t  run;               /* -1 for separators between runs */
    uint32_t offset;            /* codepoint offset within the run */
};

/* Flat corpus of codepoints plus a parallel back-map into the runs. */
struct PageTextIndex {
    int                   page_number;
    std::vector<TextRun>  runs;
    std::vector<uint32_t> run_lengths;   /* codepoints per run */
    std::u32string        corpus;
    std::vector<CharRef>  refs;
    NormalizedText        normalized;    /* indices into corpus */
    NormalizedText        stripped;
};

/* Reading order: lines top-down (baseline within tolerance), then left-right. */
std::vector<TextRun> order_runs(std::vector<TextRun> runs, double tolerance);

/* Runs are indexed in the order given. */
PageTextIndex build_page_index(int page_number, std::vector<TextRun> runs);

std::string page_text(const PageTextIndex& index);

/* ── phrase location ───────────────────────────────────────────── */

enum class MatchStrategy { None, Strict, Aggressive, Suggested };

const char* match_strategy_name(MatchStrategy m);

struct RunSpan {
    uint32_t run;
    double   start, end;        /* fractions of the run's character length */
};

struct PageSpans {
    int                  page_number;
    std::vector<RunSpan> spans;
};

struct Location {
    MatchStrategy          strategy = MatchStrategy::None;
    std::vector<PageSpans> pages;

    bool found() const { return strategy != MatchStrategy::None; }
};

/* inclusive corpus indices */
struct CorpusRange {
    size_t first, last;
};

using PhraseSuggester = std::function<std::optional<std::string>(
    const std::string& page_text, const std::string& phrase)>;

struct LocateOptions {
    bool                   bridging   = true;
    bool                   aggressive = true;
    const PhraseSuggester* suggester  = nullptr;
    Diagnostics*           diag       = nullptr;
};

std::optional<CorpusRange> match_strict(const PageTextIndex& index,
                                        const std::string& phrase,
                                        size_t from = 0,
                                        bool whole_word = false);
std::optional<CorpusRange> match_aggressive(const PageTextIndex& index,
                                            const std::string& phrase,
                                            size_t from = 0);

std::vector<RunSpan> range_to_spans(const PageTextIndex& index,
                                    const CorpusRange& range);

Location locate_phrase(const std::string& phrase,
                       const PageTextIndex& primary,
                       const PageTextIndex* prev,
                       const PageTextIndex* next,
                       const LocateOptions& opts);

/* ── annotation planning ───────────────────────────────────────── */

constexpr double kMinMarkWidth = 1.0;

/* One drawable region in page coordinates. */
struct MarkSpan {
    uint32_t run;
    double   x0, x1;
    double   y, height;
};

struct AnnotationPlan {
    std::vector<MarkSpan> underline;
    std::vector<MarkSpan> emphasis;
    bool                  boundary_pair = false;  /* emphasis is two endpoints */
};

MarkSpan       place_span(const TextRun& run, uint32_t run_index,
                          double start, double end);
AnnotationPlan plan_annotation(const Correction& corr,
                               const PageTextIndex& page,
                               const std::vector<RunSpan>& context);

/* Context spans on one page of a location. */
struct ContextOnPage {
    const PageTextIndex* page;
    std::vector<RunSpan> spans;
};

/* One plan per part; emphasis is found once across all parts and split by page. */
std::vector<AnnotationPlan> plan_annotation(const Correction& corr,
                                            const std::vector<ContextOnPage>& parts);

/* ── collaborators ─────────────────────────────────────────────── */

class ScriptDocument {
public:
    virtual ~ScriptDocument() = default;
    virtual int page_count() const = 0;
    /* 1-based; runs in extraction order */
    virtual std::vector<TextRun> page_runs(int page_number) = 0;
};

class PackWriter {
public:
    virtual ~PackWriter() = default;
    /* Appends a copy of a 1-based source page; it becomes the current page. */
    virtual bool   copy_page(int source_page) = 0;
    virtual double page_width() const = 0;
    virtual double page_height() const = 0;
    virtual void   draw_line(double x0, double y0, double x1, double y1,
                             double thickness) = 0;
    virtual void   draw_ellipse(double cx, double cy, double rx, double ry,
                                double thickness) = 0;
    virtual void   draw_rect(double x, double y, double w, double h,
                             double border) = 0;
    virtual void   draw_text(const std::string& text, double x, double y,
                             double size) = 0;
    virtual double text_width(const std::string& text, double size) = 0;
    virtual int    page_count() const = 0;
    virtual std::vector<uint8_t> save() = 0;
};

/* ── pack assembly ─────────────────────────────────────────────── */

struct PackResult {
    int                  status;
    std::string          error;
    int                  page_count;
    std::vector<int>     pages;      /* source page numbers copied */
    std::vector<uint8_t> bytes;
};

std::string              format_timestamp(const std::string& ts);
std::vector<std::string> note_blocks(const std::vector<const Correction*>& members,
                                     bool audible);
std::vector<std::string> wrap_text(const std::string& text, double max_width,
                                   double size, PackWriter& writer);

PackResult assemble_pack(const std::vector<Correction>& corrections,
                         ScriptDocument& script, PackWriter& writer,
                         const Options& opts, Diagnostics& diag,
                         const PhraseSuggester* suggester);

/* ── PDF backend (PDFium) ──────────────────────────────────────── */

std::unique_ptr<ScriptDocument> open_script_pdf(const void* buf, size_t len,
                                                const char* password);

PackResult build_pack_pdf(const void* buf, size_t len,
                          const std::vector<Correction>& corrections,
                          const Options& opts, Diagnostics& diag,
                          const PhraseSuggester* suggester);

#endif
