#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "data_io.h"
#include "structures/factory.h"

namespace fs = std::filesystem;

class DataIoTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("rmq_data_io_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path write_file(const std::string &name, const std::string &content) const {
        fs::path p = dir / name;
        std::ofstream out(p);
        out << content;
        return p;
    }
};

TEST(ParseCellTest, Integers) {
    EXPECT_EQ(parse_cell("42"), Cell{int64_t{42}});
    EXPECT_EQ(parse_cell("-7"), Cell{int64_t{-7}});
    EXPECT_EQ(parse_cell("  13 "), Cell{int64_t{13}});
}

TEST(ParseCellTest, FloatingPoint) {
    EXPECT_EQ(parse_cell("2.5"), Cell{2.5});
    EXPECT_EQ(parse_cell("-0.125"), Cell{-0.125});
    EXPECT_EQ(parse_cell("1e3"), Cell{1000.0});
}

TEST(ParseCellTest, AnythingElseStaysText) {
    EXPECT_EQ(parse_cell("abc"), Cell{std::string("abc")});
    EXPECT_EQ(parse_cell("12abc"), Cell{std::string("12abc")});
    EXPECT_EQ(parse_cell(""), Cell{std::string("")});
}

TEST_F(DataIoTest, ReadsNamedColumn) {
    auto p = write_file("values_5.csv", "id,value\n0,5.0\n1,3\n2,8.5\r\n3,2\n4,7.25\n");
    auto cells = read_column_csv(p, "value");

    ASSERT_EQ(cells.size(), 5u);
    EXPECT_EQ(cells[0], Cell{5.0});
    EXPECT_EQ(cells[1], Cell{int64_t{3}});
    EXPECT_EQ(cells[2], Cell{8.5});

    auto values = numeric_sequence(cells);
    EXPECT_EQ(values, (std::vector<double>{5.0, 3.0, 8.5, 2.0, 7.25}));
}

TEST_F(DataIoTest, HeaderWhitespaceIsIgnored) {
    auto p = write_file("spaced.csv", "id , value \n0,1.5\n1,-2\n");
    auto values = numeric_sequence(read_column_csv(p, "value"));
    EXPECT_EQ(values, (std::vector<double>{1.5, -2.0}));
}

TEST_F(DataIoTest, NonNumericCellMakesSequenceImproper) {
    auto p = write_file("bad.csv", "value\n1.0\noops\n3.0\n");
    auto cells = read_column_csv(p);
    ASSERT_EQ(cells.size(), 3u);
    EXPECT_THROW(numeric_sequence(cells), InvalidTypeError);
    EXPECT_THROW(create_structure_from_cells(StructureType::SEGMENT_TREE, cells), InvalidTypeError);
}

TEST_F(DataIoTest, NaNCellMakesSequenceImproper) {
    auto p = write_file("nan.csv", "value\nnan\n1.0\n2.0\n");
    auto cells = read_column_csv(p);
    ASSERT_EQ(cells.size(), 3u);
    EXPECT_THROW(numeric_sequence(cells), InvalidTypeError);
    for (StructureType type : all_structure_types()) {
        EXPECT_THROW(create_structure_from_cells(type, cells), InvalidTypeError) << structure_name(type);
    }
}

TEST_F(DataIoTest, HeaderOnlyFileGivesEmptyInput) {
    auto p = write_file("empty.csv", "value\n");
    auto cells = read_column_csv(p);
    EXPECT_TRUE(cells.empty());
    EXPECT_THROW(create_structure_from_cells(StructureType::NAIVE, cells), EmptyInputError);
}

TEST_F(DataIoTest, MissingFileColumnOrHeader) {
    EXPECT_THROW(read_column_csv(dir / "missing.csv"), std::runtime_error);

    auto p = write_file("other.csv", "a,b\n1,2\n");
    EXPECT_THROW(read_column_csv(p, "value"), std::runtime_error);

    auto blank = write_file("blank.csv", "");
    EXPECT_THROW(read_column_csv(blank), std::runtime_error);
}

TEST_F(DataIoTest, ListsDatasetsBySize) {
    write_file("random_uniform_10000.csv", "value\n1\n");
    write_file("random_uniform_100.csv", "value\n1\n");
    write_file("random_uniform_1000.csv", "value\n1\n");
    write_file("notes.txt", "ignored");
    write_file("no_size.csv", "value\n1\n");

    auto datasets = list_datasets(dir);
    ASSERT_EQ(datasets.size(), 3u);

    std::vector<size_t> sizes;
    for (const auto &[n, path] : datasets) sizes.push_back(n);
    EXPECT_EQ(sizes, (std::vector<size_t>{100, 1000, 10000}));
    EXPECT_EQ(datasets.at(1000).filename().string(), "random_uniform_1000.csv");

    EXPECT_THROW(list_datasets(dir / "nope"), std::runtime_error);
}
