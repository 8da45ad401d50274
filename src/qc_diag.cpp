#include "qcpack_types.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>

using json = nlohmann::json;

const char* diag_kind_name(DiagKind k) {
    switch (k) {
        case DiagKind::CorrectionDropped:  return "correction_dropped";
        case DiagKind::PhraseNotLocated:   return "phrase_not_located";
        case DiagKind::PageOutOfRange:     return "page_out_of_range";
        case DiagKind::SuggestionRejected: return "suggestion_rejected";
    }
    return "unknown";
}

std::string diagnostic_json(const Diagnostic& d) {
    json obj;
    obj["kind"]    = diag_kind_name(d.kind);
    obj["page"]    = d.page;
    obj["id"]      = d.id.empty() ? json(nullptr) : json(d.id);
    obj["message"] = d.message;
    return obj.dump();
}

void Diagnostics::emit(DiagKind kind, int page, const std::string& id,
                       const std::string& message) {
    entries.push_back({kind, page, id, message});
    if (cb) {
        std::string s = diagnostic_json(entries.back());
        cb(s.c_str(), user_data);
    }
}

size_t Diagnostics::count(DiagKind kind) const {
    return static_cast<size_t>(std::count_if(
        entries.begin(), entries.end(),
        [kind](const Diagnostic& d) { return d.kind == kind; }));
}
