#include "qcpack.h"
#include "qcpack_types.h"

#include <fpdfview.h>
#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

/* ── session implementation ─────────────────────────────────────────── */

struct qcpack_session {
    Options     opts;
    Diagnostics diag;

    qcpack_suggest_callback suggest_cb        = nullptr;
    void*                   suggest_user_data = nullptr;

    std::vector<Correction> corrections;

    /* correction iterator */
    size_t            index = 0;
    qcpack_correction view;
    std::string       json_row;

    PackResult  pack{QCPACK_OK, "", 0, {}, {}};
    std::string error;
    std::string options_text;
};

static int fail(qcpack_session* s, int status, const std::string& message) {
    s->error = message;
    return status;
}

/* ── lifecycle ──────────────────────────────────────────────────────── */

void qcpack_init(void)    { FPDF_InitLibrary(); }
void qcpack_destroy(void) { FPDF_DestroyLibrary(); }

/* ── format detection ───────────────────────────────────────────────── */

const char* qcpack_detect(const void* buf, size_t len) {
    auto* p = static_cast<const uint8_t*>(buf);
    if (p && len >= 4 && p[0] == 'P' && p[1] == 'K' && p[2] == 3 && p[3] == 4)
        return "xlsx";
    return "csv";
}

/* ── open / configure ───────────────────────────────────────────────── */

/* message of the last qcpack_open that failed on this thread */
static thread_local std::string open_error;

qcpack_session* qcpack_open(const char* config_json) {
    auto* s = new qcpack_session{};
    open_error.clear();
    if (config_json && *config_json &&
        options_from_json(config_json, s->opts, &s->error) != QCPACK_OK) {
        open_error = std::move(s->error);
        delete s;
        return nullptr;
    }
    return s;
}

void qcpack_set_diag_callback(qcpack_session* s, qcpack_diag_callback cb,
                              void* user_data) {
    if (!s) return;
    s->diag.cb        = cb;
    s->diag.user_data = user_data;
}

void qcpack_set_suggest_callback(qcpack_session* s, qcpack_suggest_callback cb,
                                 void* user_data) {
    if (!s) return;
    s->suggest_cb        = cb;
    s->suggest_user_data = user_data;
}

/* ── report ─────────────────────────────────────────────────────────── */

int qcpack_load_report(qcpack_session* s, const void* buf, size_t len) {
    if (!s) return QCPACK_ERR_BAD_INPUT;
    s->corrections.clear();
    s->index = 0;
    s->error.clear();

    ReportResult r = parse_report(buf, len, s->opts, s->diag);
    if (r.status != QCPACK_OK) return fail(s, r.status, r.error);

    s->corrections = std::move(r.corrections);
    return static_cast<int>(s->corrections.size());
}

const qcpack_correction* qcpack_next_correction(qcpack_session* s) {
    if (!s || s->index >= s->corrections.size()) return nullptr;
    const Correction& c = s->corrections[s->index++];
    s->view.id         = c.id.c_str();
    s->view.page       = c.page;
    s->view.context    = c.context.c_str();
    s->view.note       = c.note.c_str();
    s->view.track      = c.track.c_str();
    s->view.timestamp  = c.timestamp.c_str();
    s->view.type       = correction_type_name(c.type);
    s->view.word_count = static_cast<int>(c.words.size());
    return &s->view;
}

const char* qcpack_next_correction_json(qcpack_session* s) {
    if (!s || s->index >= s->corrections.size()) return nullptr;
    const Correction& c = s->corrections[s->index++];
    json obj;
    obj["id"]        = c.id;
    obj["page"]      = c.page;
    obj["context"]   = c.context;
    obj["note"]      = c.note;
    obj["track"]     = c.track.empty() ? json(nullptr) : json(c.track);
    obj["timestamp"] = c.timestamp.empty() ? json(nullptr) : json(c.timestamp);
    obj["type"]      = correction_type_name(c.type);
    obj["words"]     = c.words;
    s->json_row = obj.dump();
    return s->json_row.c_str();
}

/* ── pack ───────────────────────────────────────────────────────────── */

int qcpack_build_pack(qcpack_session* s, const void* pdf, size_t len) {
    if (!s) return QCPACK_ERR_BAD_INPUT;
    s->error.clear();
    s->pack = PackResult{QCPACK_OK, "", 0, {}, {}};

    PhraseSuggester suggester;
    if (s->suggest_cb) {
        qcpack_suggest_callback cb = s->suggest_cb;
        void* user_data = s->suggest_user_data;
        suggester = [cb, user_data](const std::string& page_text,
                                    const std::string& phrase) -> std::optional<std::string> {
            const char* r = cb(page_text.c_str(), phrase.c_str(), user_data);
            if (!r) return std::nullopt;
            return std::string(r);
        };
    }

    PackResult r = build_pack_pdf(pdf, len, s->corrections, s->opts, s->diag,
                                  s->suggest_cb ? &suggester : nullptr);
    if (r.status != QCPACK_OK) return fail(s, r.status, r.error);

    s->pack = std::move(r);
    return s->pack.page_count;
}

const unsigned char* qcpack_pack_bytes(qcpack_session* s, size_t* len) {
    if (len) *len = 0;
    if (!s || s->pack.bytes.empty()) return nullptr;
    if (len) *len = s->pack.bytes.size();
    return s->pack.bytes.data();
}

/* ── misc ───────────────────────────────────────────────────────────── */

const char* qcpack_last_error(qcpack_session* s) {
    if (!s) return open_error.c_str();
    return s->error.c_str();
}

const char* qcpack_options_json(qcpack_session* s) {
    if (!s) return nullptr;
    s->options_text = options_to_json(s->opts);
    return s->options_text.c_str();
}

void qcpack_close(qcpack_session* s) {
    delete s;
}
