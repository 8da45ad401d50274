#include "qcpack_types.h"

#include <gtest/gtest.h>
#include <xlnt/xlnt.hpp>

#include <cstring>
#include <string>
#include <vector>

static std::vector<std::uint8_t> workbook_bytes(xlnt::workbook& wb) {
    std::vector<std::uint8_t> bytes;
    wb.save(bytes);
    return bytes;
}

TEST(Xlsx, FirstSheetRows) {
    xlnt::workbook wb;
    auto ws = wb.active_sheet();
    ws.cell("A1").value("ID");
    ws.cell("B1").value("PAGE");
    ws.cell("C1").value("CONTEXT");
    ws.cell("D1").value("STATUS");
    ws.cell("E1").value("NOTES");
    ws.cell("A2").value(1);
    ws.cell("B2").value(7);
    ws.cell("C2").value("a line of text");
    ws.cell("D2").value("Fix Not Possible Without Pickup");
    ws.cell("E2").value("Missing: line");
    auto bytes = workbook_bytes(wb);

    EXPECT_STREQ(qcpack_detect(bytes.data(), bytes.size()), "xlsx");

    Table t;
    std::string err;
    ASSERT_EQ(read_xlsx_rows(bytes.data(), bytes.size(), t, &err), QCPACK_OK) << err;
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[0][2], "CONTEXT");
    EXPECT_EQ(t[1][2], "a line of text");

    Diagnostics diag;
    auto r = parse_report(bytes.data(), bytes.size(), Options{}, diag);
    ASSERT_EQ(r.status, QCPACK_OK);
    ASSERT_EQ(r.corrections.size(), 1u);
    EXPECT_EQ(r.corrections[0].page, 7);
}

TEST(Xlsx, MergedCellsReadEmpty) {
    xlnt::workbook wb;
    auto ws = wb.active_sheet();
    ws.cell("A1").value("title");
    ws.cell("C1").value("hidden");
    ws.merge_cells("A1:C1");
    ws.cell("A2").value("x");
    auto bytes = workbook_bytes(wb);

    Table t;
    ASSERT_EQ(read_xlsx_rows(bytes.data(), bytes.size(), t, nullptr), QCPACK_OK);
    ASSERT_GE(t.size(), 1u);
    ASSERT_EQ(t[0].size(), 3u);
    EXPECT_EQ(t[0][0], "title");
    EXPECT_EQ(t[0][1], "");
    EXPECT_EQ(t[0][2], "");
}

TEST(Xlsx, CorruptArchiveIsBadReport) {
    const char junk[] = "PK\x03\x04 definitely not a workbook";
    Table t;
    std::string err;
    EXPECT_EQ(read_xlsx_rows(junk, sizeof(junk) - 1, t, &err), QCPACK_ERR_BAD_REPORT);
    EXPECT_FALSE(err.empty());
}
