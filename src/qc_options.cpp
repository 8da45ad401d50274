#include "qcpack_types.h"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

/* ── helpers ────────────────────────────────────────────────────────── */

template <typename T>
static void read_key(const json& j, const char* key, T& field) {
    if (j.contains(key)) field = j.at(key).get<T>();
}

const char* dialect_name(Dialect d) {
    return d == Dialect::PostQc ? "post-qc" : "standard";
}

static bool parse_dialect(const std::string& name, std::optional<Dialect>& out) {
    if (name == "auto")     { out.reset();                 return true; }
    if (name == "standard") { out = Dialect::Standard;     return true; }
    if (name == "post-qc")  { out = Dialect::PostQc;       return true; }
    return false;
}

/* ── load / dump ────────────────────────────────────────────────────── */

int options_from_json(const std::string& text, Options& out, std::string* error) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            if (error) *error = "configuration must be a JSON object";
            return QCPACK_ERR_BAD_CONFIG;
        }

        Options opts = out;
        read_key(j, "audible", opts.audible);
        read_key(j, "page_offset", opts.page_offset);
        read_key(j, "bridging", opts.bridging);
        read_key(j, "aggressive_match", opts.aggressive_match);
        read_key(j, "mark_audible", opts.mark_audible);
        read_key(j, "line_tolerance", opts.line_tolerance);
        read_key(j, "gating_status", opts.gating_status);
        read_key(j, "accepted_comments", opts.accepted_comments);

        if (j.contains("dialect")) {
            std::string name = j.at("dialect").get<std::string>();
            if (!parse_dialect(name, opts.dialect)) {
                if (error) *error = "unknown dialect '" + name + "'";
                return QCPACK_ERR_BAD_CONFIG;
            }
        }

        if (j.contains("notes_box")) {
            const json& nb = j.at("notes_box");
            read_key(nb, "margin", opts.notes_box.margin);
            read_key(nb, "font_size", opts.notes_box.font_size);
            read_key(nb, "line_height", opts.notes_box.line_height);
            read_key(nb, "width_ratio", opts.notes_box.width_ratio);
            read_key(nb, "padding", opts.notes_box.padding);
        }

        out = std::move(opts);
        return QCPACK_OK;
    } catch (const json::exception& e) {
        if (error) *error = e.what();
        return QCPACK_ERR_BAD_CONFIG;
    }
}

std::string options_to_json(const Options& opts) {
    json obj;
    obj["audible"]           = opts.audible;
    obj["dialect"]           = opts.dialect ? dialect_name(*opts.dialect) : "auto";
    obj["page_offset"]       = opts.page_offset;
    obj["bridging"]          = opts.bridging;
    obj["aggressive_match"]  = opts.aggressive_match;
    obj["mark_audible"]      = opts.mark_audible;
    obj["line_tolerance"]    = opts.line_tolerance;
    obj["gating_status"]     = opts.gating_status;
    obj["accepted_comments"] = opts.accepted_comments;

    json nb;
    nb["margin"]      = opts.notes_box.margin;
    nb["font_size"]   = opts.notes_box.font_size;
    nb["line_height"] = opts.notes_box.line_height;
    nb["width_ratio"] = opts.notes_box.width_ratio;
    nb["padding"]     = opts.notes_box.padding;
    obj["notes_box"]  = nb;

    return obj.dump(2);
}
