#include "test_helpers.hpp"
#include <managers/jsonl_writer.hpp>
#include <algorithm>

class JsonlWriterTest : public TempDirTest {};

TEST_F(JsonlWriterTest, PartFileNames) {
    EXPECT_EQ(output_part_path(test_dir, 1).filename(), "part-000001.jsonl");
    EXPECT_EQ(output_part_path(test_dir, 42).filename(), "part-000042.jsonl");
}

TEST_F(JsonlWriterTest, WritesOneRowPerLine) {
    fs::path dir = test_dir / "data";
    {
        JsonlPartWriter writer(dir, false);
        EXPECT_EQ(writer.write_row(json{{"id", "a"}}), std::string("{\"id\":\"a\"}").size() + 1);
        writer.write_row(json{{"id", "b"}});
        writer.flush();
    }
    auto lines = read_lines(output_part_path(dir, 1));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(json::parse(lines[1])["id"], "b");
}

TEST_F(JsonlWriterTest, RotatesWhenPartIsFull) {
    fs::path dir = test_dir / "data";
    JsonlPartWriter writer(dir, false, 10);
    writer.write_line("aaaa");      // 5 bytes
    writer.write_line("bbbb");      // 10 bytes, still fits
    writer.write_line("cccc");      // would be 15, rotates
    writer.write_line("a-very-long-line-over-the-limit");
    writer.flush();

    EXPECT_EQ(writer.part_index(), 3u);
    EXPECT_EQ(read_lines(output_part_path(dir, 1)), (std::vector<std::string>{"aaaa", "bbbb"}));
    EXPECT_EQ(read_lines(output_part_path(dir, 2)), (std::vector<std::string>{"cccc"}));
    EXPECT_EQ(read_lines(output_part_path(dir, 3)).size(), 1u);
}

TEST_F(JsonlWriterTest, OversizedLineGoesIntoEmptyPart) {
    fs::path dir = test_dir / "data";
    JsonlPartWriter writer(dir, false, 4);
    writer.write_line("0123456789");
    writer.flush();
    EXPECT_EQ(writer.part_index(), 1u);
    EXPECT_EQ(writer.current_bytes(), 11u);
}

TEST_F(JsonlWriterTest, AppendContinuesHighestPart) {
    fs::path dir = test_dir / "data";
    write_file(output_part_path(dir, 1), "one\n");
    write_file(output_part_path(dir, 2), "two\n");
    {
        JsonlPartWriter writer(dir, true);
        EXPECT_EQ(writer.part_index(), 2u);
        EXPECT_EQ(writer.current_bytes(), 4u);
        writer.write_line("three");
        writer.flush();
    }
    EXPECT_EQ(read_lines(output_part_path(dir, 2)), (std::vector<std::string>{"two", "three"}));
}

TEST_F(JsonlWriterTest, NonAppendTruncatesFirstPart) {
    fs::path dir = test_dir / "data";
    write_file(output_part_path(dir, 1), "stale\n");
    {
        JsonlPartWriter writer(dir, false);
        writer.write_line("fresh");
        writer.flush();
    }
    EXPECT_EQ(read_lines(output_part_path(dir, 1)), (std::vector<std::string>{"fresh"}));
}

TEST_F(JsonlWriterTest, ListPartIndicesIgnoresOtherFiles) {
    fs::path dir = test_dir / "data";
    write_file(output_part_path(dir, 3), "");
    write_file(output_part_path(dir, 1), "");
    write_file(dir / "part-abc.jsonl", "");
    write_file(dir / "notes.txt", "");

    auto indices = list_output_part_indices(dir);
    std::sort(indices.begin(), indices.end());
    EXPECT_EQ(indices, (std::vector<size_t>{1, 3}));
    EXPECT_TRUE(list_output_part_indices(test_dir / "missing").empty());
}
