#include <gtest/gtest.h>
#include "catalog/csv_table.hpp"
#include "catalog/field_extractors.hpp"
#include "catalog/puzzle.hpp"
#include "catalog/record_loader.hpp"
#include "common/errors.hpp"
#include "ledger/completion_ledger.hpp"

#include <optional>
#include <sstream>

using namespace nonorec;

namespace {

const char* kCatalogHeader =
    "Puzzle ID:Puzzle Name,Author,Added,Rating,XP,Size,Puzzle<br>type\n";

std::vector<PuzzleRecord> loadFromText(const std::string& text,
                                       const CompletionLedger& ledger = {}) {
    std::istringstream in(text);
    return loadCatalog(in, "catalog.csv", PuzzleCategory::BlackWhite, CatalogLayout{}, ledger);
}

} // namespace

// ─── Puzzle Record ─────────────────────────────────────────────

TEST(CatalogTest, SizeIsShorterDimension) {
    PuzzleRecord p;
    p.xp = 50;
    p.width = 5;
    p.height = 10;
    EXPECT_EQ(p.size(), 5);
    EXPECT_DOUBLE_EQ(p.scorePerSize(), 10.0);
    EXPECT_EQ(p.dimensions(), "5x10");

    p.width = 25;
    p.height = 20;
    p.xp = 45;
    EXPECT_EQ(p.size(), 20);
    EXPECT_DOUBLE_EQ(p.scorePerSize(), 2.25);
}

// ─── CSV Table ─────────────────────────────────────────────────

TEST(CatalogTest, CsvParsesQuotedFields) {
    std::istringstream in(
        "Name,Note\n"
        "\"Smith, John\",\"said \"\"hi\"\"\"\n"
        "\"multi\nline\",plain\n");
    CsvTable table = CsvTable::parse(in);

    ASSERT_EQ(table.rowCount(), 2);
    EXPECT_EQ(table.cell(0, 0), "Smith, John");
    EXPECT_EQ(table.cell(0, 1), "said \"hi\"");
    EXPECT_EQ(table.cell(1, 0), "multi\nline");
    EXPECT_EQ(table.cell(1, 1), "plain");
}

TEST(CatalogTest, CsvStripsBomCrlfAndBlankLines) {
    std::istringstream in("\xEF\xBB\xBFName,LastDone\r\n\r\nA,1\r\n\nB,2\r\n");
    CsvTable table = CsvTable::parse(in);

    EXPECT_EQ(table.header()[0], "Name");
    EXPECT_EQ(table.header()[1], "LastDone");
    ASSERT_EQ(table.rowCount(), 2);
    EXPECT_EQ(table.cell(1, 1), "2");

    // Quoted first header cell straight after the byte order mark
    std::istringstream quoted("\xEF\xBB\xBF\"Name\",LastDone\nA,2026-01-01\n");
    CsvTable excel = CsvTable::parse(quoted);
    EXPECT_EQ(excel.header()[0], "Name");
    EXPECT_EQ(excel.columnIndex("Name"), std::optional<size_t>(0));
    EXPECT_EQ(excel.cell(0, 0), "A");
}

TEST(CatalogTest, BomOnlyStrippedAtStartOfInput) {
    std::istringstream in("Name\n\xEF\xBB\xBF" "A\n");
    CsvTable table = CsvTable::parse(in);
    ASSERT_EQ(table.rowCount(), 1);
    EXPECT_EQ(table.cell(0, 0), "\xEF\xBB\xBF" "A");
}

TEST(CatalogTest, CsvShortRowReadsEmptyCells) {
    std::istringstream in("a,b,c\n1\n");
    CsvTable table = CsvTable::parse(in);
    EXPECT_EQ(table.cell(0, 0), "1");
    EXPECT_EQ(table.cell(0, 2), "");
}

TEST(CatalogTest, CsvWithoutHeaderIsConfigError) {
    std::istringstream in("\n\n");
    EXPECT_THROW(CsvTable::parse(in), ConfigError);
}

TEST(CatalogTest, CsvUnterminatedQuoteIsConfigError) {
    std::istringstream in("a,b\n\"open,1\n");
    EXPECT_THROW(CsvTable::parse(in), ConfigError);
}

TEST(CatalogTest, CsvWriteQuotesOnlyWhenNeeded) {
    CsvTable table({"Name", "LastDone"});
    table.addRow({"plain", "x"});
    table.addRow({"a,b", "say \"q\""});

    std::ostringstream out;
    table.write(out);
    EXPECT_EQ(out.str(),
              "Name,LastDone\n"
              "plain,x\n"
              "\"a,b\",\"say \"\"q\"\"\"\n");

    std::istringstream in(out.str());
    CsvTable reread = CsvTable::parse(in);
    EXPECT_EQ(reread.rows(), table.rows());
}

TEST(CatalogTest, RequireColumnNamesMissingColumn) {
    std::istringstream in("a,b\n");
    CsvTable table = CsvTable::parse(in, "data.csv");
    EXPECT_EQ(table.requireColumn("b"), 1u);
    try {
        table.requireColumn("Size");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("Size"), std::string::npos);
        EXPECT_NE(msg.find("data.csv"), std::string::npos);
    }
}

TEST(CatalogTest, ReadMissingFileIsIoError) {
    EXPECT_THROW(CsvTable::readFile("/nonexistent/dir/Colors.csv"), IoError);
}

// ─── Field Extractors ──────────────────────────────────────────

TEST(CatalogTest, ApproxIntStripsMarker) {
    EXPECT_EQ(extractApproxInt("~50"), 50);
    EXPECT_EQ(extractApproxInt("30"), 30);
    EXPECT_EQ(extractApproxInt(" ~120 "), 120);
    EXPECT_THROW(extractApproxInt("abc"), ConfigError);
    EXPECT_THROW(extractApproxInt("12xp"), ConfigError);
    EXPECT_THROW(extractApproxInt("~"), ConfigError);
}

TEST(CatalogTest, DimensionsRequireTwoParts) {
    auto [w, h] = extractDimensions("5x10");
    EXPECT_EQ(w, 5);
    EXPECT_EQ(h, 10);

    EXPECT_THROW(extractDimensions("5"), ConfigError);
    EXPECT_THROW(extractDimensions("5x"), ConfigError);
    EXPECT_THROW(extractDimensions("5x10x2"), ConfigError);
    EXPECT_THROW(extractDimensions("5*10"), ConfigError);
    EXPECT_THROW(extractDimensions("ax10"), ConfigError);
    EXPECT_THROW(extractDimensions("0x10"), ConfigError);
}

TEST(CatalogTest, DifficultyFromMarker) {
    const std::string marker = "True_nonogram_icon.png";
    EXPECT_EQ(extractDifficulty("<img src=\"/True_nonogram_icon.png\">", marker),
              PuzzleDifficulty::TrueNonogram);
    EXPECT_EQ(extractDifficulty("other", marker), PuzzleDifficulty::OtherNonogram);
    EXPECT_EQ(extractDifficulty("", marker), PuzzleDifficulty::OtherNonogram);
}

TEST(CatalogTest, ColumnRefResolve) {
    std::istringstream in("a,b,c\n");
    CsvTable table = CsvTable::parse(in);

    EXPECT_EQ(ColumnRef::byName("c").resolve(table), 2u);
    EXPECT_EQ(ColumnRef::byPosition(1).resolve(table), 1u);
    EXPECT_THROW(ColumnRef::byPosition(3).resolve(table), ConfigError);
    EXPECT_THROW(ColumnRef::byName("d").resolve(table), ConfigError);
    EXPECT_EQ(ColumnRef::byPosition(4).describe(), "#4");
    EXPECT_EQ(ColumnRef::byName("Size").describe(), "'Size'");
}

// ─── Record Loader ─────────────────────────────────────────────

TEST(CatalogTest, LoadsCatalogRows) {
    auto records = loadFromText(std::string(kCatalogHeader) +
        "A,someone,2020,5,~50,5x10,\"<img src=\"\"True_nonogram_icon.png\"\">\"\n"
        "B,other,2021,4,30,10x10,other\n");

    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].name, "A");
    EXPECT_EQ(records[0].xp, 50);
    EXPECT_EQ(records[0].width, 5);
    EXPECT_EQ(records[0].height, 10);
    EXPECT_EQ(records[0].difficulty, PuzzleDifficulty::TrueNonogram);
    EXPECT_EQ(records[0].category, PuzzleCategory::BlackWhite);
    EXPECT_EQ(records[0].last_done, kNeverDone);

    EXPECT_EQ(records[1].name, "B");
    EXPECT_EQ(records[1].xp, 30);
    EXPECT_EQ(records[1].size(), 10);
    EXPECT_EQ(records[1].difficulty, PuzzleDifficulty::OtherNonogram);
}

TEST(CatalogTest, LoaderMergesLedgerTimestamps) {
    CompletionLedger ledger;
    Timestamp done = parseTimestamp("2025-06-01 08:00:00").value();
    ledger.upsert("B", done);

    auto records = loadFromText(std::string(kCatalogHeader) +
        "A,x,x,x,10,5x5,t\n"
        "B,x,x,x,20,5x5,t\n", ledger);

    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].last_done, kNeverDone);
    EXPECT_EQ(records[1].last_done, done);
}

TEST(CatalogTest, MissingNamedColumnIsFatal) {
    EXPECT_THROW(loadFromText(
        "Puzzle ID:Puzzle Name,Author,Added,Rating,XP,Puzzle<br>type\n"
        "A,x,x,x,10,t\n"), ConfigError);
}

TEST(CatalogTest, MissingPositionalColumnIsFatal) {
    // Fails on the header alone, even with no data rows
    EXPECT_THROW(loadFromText("Puzzle ID:Puzzle Name,Size,Puzzle<br>type\n"), ConfigError);
}

TEST(CatalogTest, MalformedSizeReportsRow) {
    try {
        loadFromText(std::string(kCatalogHeader) +
            "A,x,x,x,10,5x5,t\n"
            "B,x,x,x,10,5 by 5,t\n");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("row 2"), std::string::npos);
        EXPECT_NE(msg.find("'Size'"), std::string::npos);
    }
}

TEST(CatalogTest, DecoderAppliesRulesInOrder) {
    std::istringstream in("k,v\none,1\ntwo,2\n");
    CsvTable table = CsvTable::parse(in);

    RowDecoder decoder;
    decoder.addRule(ColumnRef::byName("k"), [](const std::string& cell, PuzzleRecord& r) {
        r.name = cell;
    });
    decoder.addRule(ColumnRef::byPosition(1), [](const std::string& cell, PuzzleRecord& r) {
        r.xp = extractApproxInt(cell) * 10;
    });
    EXPECT_EQ(decoder.ruleCount(), 2);

    PuzzleRecord prototype;
    prototype.category = PuzzleCategory::Color;
    auto records = decoder.decode(table, prototype);

    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[1].name, "two");
    EXPECT_EQ(records[1].xp, 20);
    EXPECT_EQ(records[1].category, PuzzleCategory::Color);
}
