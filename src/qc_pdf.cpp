#include "qcpack_types.h"

#include <fpdfview.h>
#include <fpdf_edit.h>
#include <fpdf_ppo.h>
#include <fpdf_save.h>
#include <fpdf_text.h>

#include <cmath>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

/* ── glyph grouping ─────────────────────────────────────────────────── */

struct CharInfo {
    std::string  font;
    double       font_size;
    double       left, bottom, right, top;   /* PDF user space, y up */
    unsigned int codepoint;
};

static bool same_font(const CharInfo& a, const CharInfo& b) {
    return a.font == b.font && std::fabs(a.font_size - b.font_size) < 0.01;
}

static bool same_line(const CharInfo& a, const CharInfo& b) {
    double line_height = a.top - a.bottom;
    if (line_height <= 0) line_height = a.font_size;
    return std::fabs(a.top - b.top) < line_height * 0.5;
}

static bool gap_ok(const CharInfo& prev, const CharInfo& cur) {
    return (cur.left - prev.right) < prev.font_size * 0.35;
}

static bool is_break(unsigned int cp) {
    return cp == ' ' || cp == '\t' || cp == '\r' || cp == '\n';
}

static std::vector<TextRun> extract_runs(FPDF_DOCUMENT doc, int pi) {
    std::vector<TextRun> runs;
    FPDF_PAGE page = FPDF_LoadPage(doc, pi);
    if (!page) return runs;
    FPDF_TEXTPAGE text_page = FPDFText_LoadPage(page);
    if (!text_page) { FPDF_ClosePage(page); return runs; }

    int char_count = FPDFText_CountChars(text_page);
    std::vector<CharInfo> chars;
    chars.reserve(char_count > 0 ? char_count : 0);

    for (int ci = 0; ci < char_count; ++ci) {
        unsigned int cp = FPDFText_GetUnicode(text_page, ci);
        if (cp == 0 || cp == 0xFFFE || cp == 0xFFFF) continue;
        if (cp == 0x02) cp = '-';     /* end-of-line soft hyphen */

        double left, right, bottom, top;
        if (!FPDFText_GetCharBox(text_page, ci, &left, &right, &bottom, &top)) continue;

        char font_name[256] = {};
        int flags = 0;
        FPDFText_GetFontInfo(text_page, ci, font_name, sizeof(font_name), &flags);
        chars.push_back({font_name, FPDFText_GetFontSize(text_page, ci),
                         left, bottom, right, top, cp});
    }

    for (size_t i = 0; i < chars.size(); ) {
        const CharInfo& first = chars[i];
        if (is_break(first.codepoint)) { ++i; continue; }

        double run_left = first.left, run_bottom = first.bottom;
        double run_right = first.right, run_top = first.top;
        std::string text;
        append_codepoint(text, first.codepoint);

        size_t j = i + 1;
        while (j < chars.size()) {
            const CharInfo& cur = chars[j];
            if (cur.codepoint == '\r' || cur.codepoint == '\n') break;
            if (!same_font(first, cur) || !same_line(first, cur)) break;
            if (!gap_ok(chars[j - 1], cur)) break;
            append_codepoint(text, cur.codepoint);
            if (cur.right  > run_right)  run_right  = cur.right;
            if (cur.top    > run_top)    run_top    = cur.top;
            if (cur.left   < run_left)   run_left   = cur.left;
            if (cur.bottom < run_bottom) run_bottom = cur.bottom;
            ++j;
        }

        while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
            text.pop_back();

        if (!text.empty())
            runs.push_back({std::move(text), run_left, run_bottom,
                            run_right - run_left, run_top - run_bottom});
        i = j;
    }

    FPDFText_ClosePage(text_page);
    FPDF_ClosePage(page);
    return runs;
}

/* ── script document ────────────────────────────────────────────────── */

class PdfiumScript : public ScriptDocument {
public:
    PdfiumScript(const void* buf, size_t len, const char* password)
        : bytes_(static_cast<const uint8_t*>(buf), static_cast<const uint8_t*>(buf) + len) {
        /* PDFium reads lazily from the buffer; it must outlive the document */
        doc_ = FPDF_LoadMemDocument(bytes_.data(), static_cast<int>(bytes_.size()), password);
    }
    ~PdfiumScript() override {
        if (doc_) FPDF_CloseDocument(doc_);
    }
    PdfiumScript(const PdfiumScript&) = delete;
    PdfiumScript& operator=(const PdfiumScript&) = delete;

    bool          ok() const { return doc_ != nullptr; }
    FPDF_DOCUMENT handle() const { return doc_; }

    int page_count() const override { return doc_ ? FPDF_GetPageCount(doc_) : 0; }

    std::vector<TextRun> page_runs(int page_number) override {
        if (page_number < 1 || page_number > page_count()) return {};
        return extract_runs(doc_, page_number - 1);
    }

private:
    std::vector<uint8_t> bytes_;
    FPDF_DOCUMENT        doc_ = nullptr;
};

std::unique_ptr<ScriptDocument> open_script_pdf(const void* buf, size_t len,
                                                const char* password) {
    if (!buf || len == 0) return nullptr;
    auto script = std::make_unique<PdfiumScript>(buf, len, password);
    if (!script->ok()) return nullptr;
    return script;
}

/* ── pack writer ────────────────────────────────────────────────────── */

static std::vector<unsigned short> to_utf16(const std::string& s) {
    std::vector<unsigned short> out;
    for (char32_t cp : utf8_decode(s)) {
        if (cp >= 0x10000) {
            cp -= 0x10000;
            out.push_back(static_cast<unsigned short>(0xD800 | (cp >> 10)));
            out.push_back(static_cast<unsigned short>(0xDC00 | (cp & 0x3FF)));
        } else {
            out.push_back(static_cast<unsigned short>(cp));
        }
    }
    out.push_back(0);
    return out;
}

struct BufferWrite : FPDF_FILEWRITE {
    std::vector<uint8_t>* out;
};

static int write_block(FPDF_FILEWRITE* self, const void* data, unsigned long size) {
    auto* w = static_cast<BufferWrite*>(self);
    const auto* p = static_cast<const uint8_t*>(data);
    w->out->insert(w->out->end(), p, p + size);
    return 1;
}

class PdfiumPackWriter : public PackWriter {
public:
    explicit PdfiumPackWriter(FPDF_DOCUMENT source)
        : src_(source), doc_(FPDF_CreateNewDocument()) {}
    ~PdfiumPackWriter() override {
        finish_page();
        if (doc_) FPDF_CloseDocument(doc_);
    }
    PdfiumPackWriter(const PdfiumPackWriter&) = delete;
    PdfiumPackWriter& operator=(const PdfiumPackWriter&) = delete;

    bool ok() const { return doc_ != nullptr; }

    bool copy_page(int source_page) override {
        finish_page();
        int index = FPDF_GetPageCount(doc_);
        std::string range = std::to_string(source_page);
        if (!FPDF_ImportPages(doc_, src_, range.c_str(), index)) return false;
        page_ = FPDF_LoadPage(doc_, index);
        if (!page_) return false;
        width_  = FPDF_GetPageWidth(page_);
        height_ = FPDF_GetPageHeight(page_);
        return true;
    }

    double page_width() const override  { return width_; }
    double page_height() const override { return height_; }

    void draw_line(double x0, double y0, double x1, double y1,
                   double thickness) override {
        if (!page_) return;
        FPDF_PAGEOBJECT path = FPDFPageObj_CreateNewPath(static_cast<float>(x0),
                                                         static_cast<float>(y0));
        FPDFPath_LineTo(path, static_cast<float>(x1), static_cast<float>(y1));
        stroke(path, thickness);
    }

    void draw_ellipse(double cx, double cy, double rx, double ry,
                      double thickness) override {
        if (!page_) return;
        const double k = 0.5523;   /* cubic approximation of a quarter arc */
        auto f = [](double v) { return static_cast<float>(v); };

        FPDF_PAGEOBJECT path = FPDFPageObj_CreateNewPath(f(cx + rx), f(cy));
        FPDFPath_BezierTo(path, f(cx + rx), f(cy + ry * k), f(cx + rx * k), f(cy + ry),
                          f(cx), f(cy + ry));
        FPDFPath_BezierTo(path, f(cx - rx * k), f(cy + ry), f(cx - rx), f(cy + ry * k),
                          f(cx - rx), f(cy));
        FPDFPath_BezierTo(path, f(cx - rx), f(cy - ry * k), f(cx - rx * k), f(cy - ry),
                          f(cx), f(cy - ry));
        FPDFPath_BezierTo(path, f(cx + rx * k), f(cy - ry), f(cx + rx), f(cy - ry * k),
                          f(cx + rx), f(cy));
        FPDFPath_Close(path);
        stroke(path, thickness);
    }

    void draw_rect(double x, double y, double w, double h, double border) override {
        if (!page_) return;
        FPDF_PAGEOBJECT rect = FPDFPageObj_CreateNewRect(
            static_cast<float>(x), static_cast<float>(y),
            static_cast<float>(w), static_cast<float>(h));
        FPDFPageObj_SetFillColor(rect, 255, 255, 255, 255);
        FPDFPageObj_SetStrokeColor(rect, 0, 0, 0, 255);
        FPDFPageObj_SetStrokeWidth(rect, static_cast<float>(border));
        FPDFPath_SetDrawMode(rect, FPDF_FILLMODE_ALTERNATE, 1);
        FPDFPage_InsertObject(page_, rect);
    }

    void draw_text(const std::string& text, double x, double y, double size) override {
        if (!page_) return;
        FPDF_PAGEOBJECT obj = make_text(text, size);
        if (!obj) return;
        FPDFPageObj_SetFillColor(obj, 0, 0, 0, 255);
        FPDFPageObj_Transform(obj, 1, 0, 0, 1, x, y);
        FPDFPage_InsertObject(page_, obj);
    }

    double text_width(const std::string& text, double size) override {
        FPDF_PAGEOBJECT obj = make_text(text, size);
        if (!obj) return 0;
        float left = 0, bottom = 0, right = 0, top = 0;
        double width = FPDFPageObj_GetBounds(obj, &left, &bottom, &right, &top)
                           ? right - left : 0;
        FPDFPageObj_Destroy(obj);
        return width;
    }

    int page_count() const override { return FPDF_GetPageCount(doc_); }

    std::vector<uint8_t> save() override {
        finish_page();
        std::vector<uint8_t> out;
        BufferWrite w;
        std::memset(static_cast<FPDF_FILEWRITE*>(&w), 0, sizeof(FPDF_FILEWRITE));
        w.version    = 1;
        w.WriteBlock = write_block;
        w.out        = &out;
        if (!FPDF_SaveAsCopy(doc_, &w, FPDF_NO_INCREMENTAL)) out.clear();
        return out;
    }

private:
    void finish_page() {
        if (!page_) return;
        FPDFPage_GenerateContent(page_);
        FPDF_ClosePage(page_);
        page_ = nullptr;
    }

    void stroke(FPDF_PAGEOBJECT path, double thickness) {
        FPDFPageObj_SetStrokeColor(path, 0, 0, 0, 255);
        FPDFPageObj_SetStrokeWidth(path, static_cast<float>(thickness));
        FPDFPath_SetDrawMode(path, FPDF_FILLMODE_NONE, 1);
        FPDFPage_InsertObject(page_, path);
    }

    FPDF_PAGEOBJECT make_text(const std::string& text, double size) {
        FPDF_PAGEOBJECT obj = FPDFPageObj_NewTextObj(doc_, "Helvetica",
                                                     static_cast<float>(size));
        if (!obj) return nullptr;
        auto wide = to_utf16(text);
        if (!FPDFText_SetText(obj, reinterpret_cast<FPDF_WIDESTRING>(wide.data()))) {
            FPDFPageObj_Destroy(obj);
            return nullptr;
        }
        return obj;
    }

    FPDF_DOCUMENT src_;
    FPDF_DOCUMENT doc_;
    FPDF_PAGE     page_   = nullptr;
    double        width_  = 0;
    double        height_ = 0;
};

/* ── public backend API ─────────────────────────────────────────────── */

PackResult build_pack_pdf(const void* buf, size_t len,
                          const std::vector<Correction>& corrections,
                          const Options& opts, Diagnostics& diag,
                          const PhraseSuggester* suggester) {
    PackResult result{QCPACK_OK, "", 0, {}, {}};
    if (!buf || len == 0) {
        result.status = QCPACK_ERR_BAD_INPUT;
        result.error  = "empty script";
        return result;
    }

    PdfiumScript script(buf, len, nullptr);
    if (!script.ok()) {
        result.status = QCPACK_ERR_BAD_PDF;
        result.error  = "could not open script PDF (error " +
                        std::to_string(FPDF_GetLastError()) + ")";
        return result;
    }

    PdfiumPackWriter writer(script.handle());
    if (!writer.ok()) {
        result.status = QCPACK_ERR_BAD_PDF;
        result.error  = "could not create output PDF";
        return result;
    }

    result = assemble_pack(corrections, script, writer, opts, diag, suggester);
    if (result.bytes.empty()) {
        result.status = QCPACK_ERR_BAD_PDF;
        result.error  = "could not serialize output PDF";
    }
    return result;
}
