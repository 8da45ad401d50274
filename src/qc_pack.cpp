#include "qcpack_types.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <vector>

/* ── note text ──────────────────────────────────────────────────────── */

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string::npos ? pos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

static std::string join(const std::vector<std::string>& v, const char* sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

/* "H:MM:SS.f" or "MM:SS.f" -> "MM:SS"; anything else verbatim */
std::string format_timestamp(const std::string& ts) {
    if (ts.empty()) return "";
    auto parts = split(ts, ':');
    if (parts.size() != 2 && parts.size() != 3) return ts;

    const std::string& minutes = parts[parts.size() - 2];
    const std::string& seconds = parts.back();
    char* endp = nullptr;
    double secs = std::strtod(seconds.c_str(), &endp);
    if (seconds.empty() || endp != seconds.c_str() + seconds.size() || secs < 0)
        return ts;

    std::string s = std::to_string(static_cast<long>(std::floor(secs)));
    if (s.size() < 2) s.insert(0, 2 - s.size(), '0');
    return minutes + ":" + s;
}

/* identical notes share one block; their track/time suffixes are joined */
std::vector<std::string> note_blocks(const std::vector<const Correction*>& members,
                                     bool audible) {
    struct Block {
        std::string              note;
        std::vector<std::string> suffixes;
    };
    std::vector<Block> blocks;

    for (const Correction* c : members) {
        std::string suffix;
        if (!audible) {
            std::string ts = format_timestamp(c->timestamp);
            if (!ts.empty()) suffix = c->track.empty() ? ts : c->track + "/" + ts;
        }

        auto it = std::find_if(blocks.begin(), blocks.end(),
                               [c](const Block& b) { return b.note == c->note; });
        if (it == blocks.end()) {
            blocks.push_back({c->note, {}});
            it = blocks.end() - 1;
        }
        if (!suffix.empty() &&
            std::find(it->suffixes.begin(), it->suffixes.end(), suffix) == it->suffixes.end())
            it->suffixes.push_back(suffix);
    }

    std::vector<std::string> out;
    out.reserve(blocks.size());
    for (const Block& b : blocks)
        out.push_back(b.suffixes.empty() ? b.note : b.note + "\n" + join(b.suffixes, ", "));
    return out;
}

std::vector<std::string> wrap_text(const std::string& text, double max_width,
                                   double size, PackWriter& writer) {
    std::vector<std::string> lines;
    for (const std::string& para : split(text, '\n')) {
        std::string line;
        for (const std::string& word : split(para, ' ')) {
            if (word.empty()) continue;
            std::string candidate = line.empty() ? word : line + " " + word;
            if (line.empty() || writer.text_width(candidate, size) <= max_width) {
                line = std::move(candidate);
            } else {
                lines.push_back(std::move(line));
                line = word;
            }
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

/* ── drawing ────────────────────────────────────────────────────────── */

static void draw_oblong(PackWriter& w, double x0, double x1, double y, double h) {
    double width = x1 - x0;
    w.draw_ellipse(x0 + width / 2, y + h / 2, width / 2 + 2, h * 0.6 + 1, 1.0);
}

static void draw_plan(PackWriter& w, const AnnotationPlan& plan, double tolerance) {
    for (const MarkSpan& m : plan.underline)
        w.draw_line(m.x0, m.y - 2, m.x1, m.y - 2, 1.0);

    if (plan.boundary_pair) {
        for (const MarkSpan& m : plan.emphasis) draw_oblong(w, m.x0, m.x1, m.y, m.height);
        return;
    }

    /* one oblong per line of emphasis */
    std::vector<std::vector<const MarkSpan*>> lines;
    for (const MarkSpan& m : plan.emphasis) {
        auto it = std::find_if(lines.begin(), lines.end(), [&](const auto& line) {
            return std::fabs(line.front()->y - m.y) < tolerance;
        });
        if (it == lines.end()) lines.push_back({&m});
        else                   it->push_back(&m);
    }
    for (const auto& line : lines) {
        double x0 = line.front()->x0, x1 = line.front()->x1;
        double h = 0;
        for (const MarkSpan* m : line) {
            x0 = std::min(x0, m->x0);
            x1 = std::max(x1, m->x1);
            h  = std::max(h, m->height);
        }
        draw_oblong(w, x0, x1, line.front()->y, h);
    }
}

static void draw_notes_box(PackWriter& w, const std::vector<std::string>& blocks,
                           const NotesBoxStyle& st) {
    double max_width = w.page_width() * st.width_ratio;
    auto lines = wrap_text(join(blocks, "\n\n"), max_width, st.font_size, w);

    double text_height = lines.size() * st.line_height;
    if (!lines.empty()) text_height -= st.line_height - st.font_size;

    double box_w = max_width + st.padding * 2;
    double box_h = text_height + st.padding * 2;
    double box_x = st.margin;
    double box_y = w.page_height() - st.margin - box_h;
    w.draw_rect(box_x, box_y, box_w, box_h, 1.0);

    double y = box_y + box_h - st.padding - st.font_size;
    for (const std::string& line : lines) {
        if (!line.empty()) w.draw_text(line, box_x + st.padding, y, st.font_size);
        y -= st.line_height;
    }
}

/* ── assemble ───────────────────────────────────────────────────────── */

PackResult assemble_pack(const std::vector<Correction>& corrections,
                         ScriptDocument& script, PackWriter& writer,
                         const Options& opts, Diagnostics& diag,
                         const PhraseSuggester* suggester) {
    PackResult result{QCPACK_OK, "", 0, {}, {}};
    const int page_count = script.page_count();

    /* page indexes live for this call only */
    std::map<int, PageTextIndex> cache;
    auto index_for = [&](int page) -> const PageTextIndex* {
        if (page < 1 || page > page_count) return nullptr;
        auto it = cache.find(page);
        if (it != cache.end()) return &it->second;
        auto runs = order_runs(script.page_runs(page), opts.line_tolerance);
        return &cache.emplace(page, build_page_index(page, std::move(runs))).first->second;
    };

    struct Entry {
        const Correction* corr;
        AnnotationPlan    plan;
    };
    std::map<int, std::vector<Entry>> buckets;

    LocateOptions lo;
    lo.bridging   = opts.bridging;
    lo.aggressive = opts.aggressive_match;
    lo.suggester  = suggester;
    lo.diag       = &diag;

    bool locate = !opts.audible || opts.mark_audible;

    std::set<long long> outside;

    for (const Correction& corr : corrections) {
        long long wide = static_cast<long long>(corr.page) + opts.page_offset;
        if (wide < 1 || wide > page_count) {
            outside.insert(wide);
            continue;
        }
        int page = static_cast<int>(wide);
        bool placed = false;

        const PageTextIndex* primary = locate ? index_for(page) : nullptr;
        if (primary) {
            const PageTextIndex* prev =
                opts.bridging && page > 1 ? index_for(page - 1) : nullptr;
            const PageTextIndex* next =
                opts.bridging && page < page_count ? index_for(page + 1) : nullptr;
            Location loc = locate_phrase(corr.context, *primary, prev, next, lo);

            std::vector<ContextOnPage> parts;
            for (const PageSpans& ps : loc.pages)
                parts.push_back({index_for(ps.page_number), ps.spans});

            std::vector<AnnotationPlan> plans = plan_annotation(corr, parts);
            for (size_t k = 0; k < parts.size(); ++k) {
                buckets[loc.pages[k].page_number].push_back({&corr, std::move(plans[k])});
                placed = true;
            }
            if (!loc.found())
                diag.emit(DiagKind::PhraseNotLocated, page, corr.id,
                          "context not found: " + corr.context);
        }

        /* unresolved corrections are still listed on their nominal page */
        if (!placed) buckets[page].push_back({&corr, AnnotationPlan{}});
    }

    for (long long page : outside) {
        auto clamped = static_cast<int>(std::clamp<long long>(
            page, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
        diag.emit(DiagKind::PageOutOfRange, clamped, "",
                  "page " + std::to_string(page) + " is outside the script (1-" +
                  std::to_string(page_count) + ")");
    }

    for (const auto& [page, entries] : buckets) {
        if (!writer.copy_page(page)) {
            diag.emit(DiagKind::PageOutOfRange, page, "",
                      "page " + std::to_string(page) + " could not be copied");
            continue;
        }

        std::vector<const Correction*> members;
        for (const Entry& e : entries) {
            draw_plan(writer, e.plan, opts.line_tolerance);
            members.push_back(e.corr);
        }
        draw_notes_box(writer, note_blocks(members, opts.audible), opts.notes_box);
        result.pages.push_back(page);
    }

    result.page_count = writer.page_count();
    result.bytes = writer.save();
    return result;
}
