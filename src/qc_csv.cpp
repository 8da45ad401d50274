#include "qcpack_types.h"

#include <cstring>
#include <string>

/* ── helpers ────────────────────────────────────────────────────────── */

static bool blank_row(const Row& row) {
    for (const auto& cell : row)
        if (cell.find_first_not_of(" \t") != std::string::npos) return false;
    return true;
}

/* ── read ───────────────────────────────────────────────────────────── */

int read_csv_rows(const void* buf, size_t len, Table& out, std::string* error) {
    out.clear();
    const char* data = static_cast<const char*>(buf);
    const char* end  = data + len;

    /* UTF-8 BOM */
    if (len >= 3 && std::memcmp(data, "\xEF\xBB\xBF", 3) == 0) data += 3;

    Row row;
    std::string field;
    bool in_quotes = false;
    size_t line = 1;
    size_t quote_line = 0;

    auto end_field = [&]() {
        row.push_back(std::move(field));
        field.clear();
    };
    auto end_row = [&]() {
        end_field();
        if (!blank_row(row)) out.push_back(std::move(row));
        row.clear();
    };

    for (const char* p = data; p < end; ++p) {
        char c = *p;
        if (in_quotes) {
            if (c == '"') {
                if (p + 1 < end && p[1] == '"') {
                    field += '"';
                    ++p;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                quote_line = line;
                break;
            case ',':
                end_field();
                break;
            case '\r':
                if (p + 1 < end && p[1] == '\n') ++p;
                end_row();
                ++line;
                break;
            case '\n':
                end_row();
                ++line;
                break;
            default:
                field += c;
        }
    }

    if (in_quotes) {
        if (error)
            *error = "unterminated quoted field starting on line " +
                     std::to_string(quote_line);
        out.clear();
        return QCPACK_ERR_BAD_REPORT;
    }

    if (!field.empty() || !row.empty()) end_row();
    return QCPACK_OK;
}
