#include "qcpack_types.h"

#include <xlnt/xlnt.hpp>
#include <sstream>
#include <string>

/* ── read ────────────────────────────────────────────────────────── */

int read_xlsx_rows(const void* buf, size_t len, Table& out, std::string* error) {
    out.clear();

    try {
        xlnt::workbook wb;
        std::string data(static_cast<const char*>(buf), len);
        std::istringstream stream(data);
        wb.load(stream);

        if (wb.sheet_count() == 0) {
            if (error) *error = "workbook has no worksheets";
            return QCPACK_ERR_BAD_REPORT;
        }

        /* the report lives on the first sheet */
        auto ws = wb.sheet_by_index(0);

        auto highest_row = ws.highest_row();
        auto highest_col = ws.highest_column();
        auto merged = ws.merged_ranges();

        for (auto row = 1u; row <= highest_row; row++) {
            Row cells;
            for (auto col = xlnt::column_t(1); col <= highest_col; col++) {
                std::string text;

                /* cells covered by a merge (not the top-left origin) read empty */
                bool is_covered = false;
                for (const auto& mr : merged) {
                    if (mr.contains(xlnt::cell_reference(col, row))) {
                        auto tl = mr.top_left();
                        if (tl.column() != col || tl.row() != row) {
                            is_covered = true;
                            break;
                        }
                    }
                }

                if (!is_covered && ws.has_cell(xlnt::cell_reference(col, row))) {
                    auto cell = ws.cell(xlnt::cell_reference(col, row));
                    if (cell.has_value()) text = cell.to_string();
                }
                cells.push_back(std::move(text));
            }
            out.push_back(std::move(cells));
        }
    } catch (const std::exception& e) {
        if (error) *error = std::string("xlsx: ") + e.what();
        out.clear();
        return QCPACK_ERR_BAD_REPORT;
    }

    return QCPACK_OK;
}
