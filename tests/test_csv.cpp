#include "qcpack_types.h"

#include <gtest/gtest.h>

#include <string>

static int read(const std::string& s, Table& t, std::string* err = nullptr) {
    return read_csv_rows(s.data(), s.size(), t, err);
}

TEST(Csv, PlainRows) {
    Table t;
    ASSERT_EQ(read("a,b,c\n1,2,3\n", t), QCPACK_OK);
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[1], (Row{"1", "2", "3"}));
}

TEST(Csv, QuotedFields) {
    Table t;
    ASSERT_EQ(read("\"x, y\",\"say \"\"hi\"\"\",\"two\nlines\"\n", t), QCPACK_OK);
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t[0][0], "x, y");
    EXPECT_EQ(t[0][1], "say \"hi\"");
    EXPECT_EQ(t[0][2], "two\nlines");
}

TEST(Csv, BomCrlfAndBlankLines) {
    Table t;
    ASSERT_EQ(read("\xEF\xBB\xBFID,PAGE\r\n\r\n,\r\n7,3", t), QCPACK_OK);
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[0][0], "ID");
    EXPECT_EQ(t[1], (Row{"7", "3"}));
}

TEST(Csv, EmptyTrailingFieldKept) {
    Table t;
    ASSERT_EQ(read("a,b,\n", t), QCPACK_OK);
    EXPECT_EQ(t[0].size(), 3u);
}

TEST(Csv, UnterminatedQuoteIsBadReport) {
    Table t;
    std::string err;
    EXPECT_EQ(read("a,b\n\"open,c\n", t, &err), QCPACK_ERR_BAD_REPORT);
    EXPECT_NE(err.find("line 2"), std::string::npos);
    EXPECT_TRUE(t.empty());
}
