#include <gtest/gtest.h>
#include "postrelay/transfer/chunk_slicer.hpp"
#include "support/temp_dir.hpp"

using namespace postrelay::transfer;
using postrelay::test_support::TempDir;
using postrelay::test_support::read_file;

class ChunkSlicerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 2500; ++i) {
            content.push_back(static_cast<char>('a' + (i % 26)));
        }
        source = temp.write_file("video.mp4", content);
    }

    TempDir temp;
    std::string content;
    std::filesystem::path source;
};

TEST_F(ChunkSlicerTest, ChunkCountIsCeiling) {
    EXPECT_EQ(ChunkSlicer::chunk_count(0, 1024), 0u);
    EXPECT_EQ(ChunkSlicer::chunk_count(1024, 1024), 1u);
    EXPECT_EQ(ChunkSlicer::chunk_count(1025, 1024), 2u);
    EXPECT_EQ(ChunkSlicer::chunk_count(2500, 1000), 3u);
}

TEST_F(ChunkSlicerTest, ZeroChunkSizeFallsBackToDefault) {
    ChunkSlicer slicer(temp.path(), 0);
    EXPECT_EQ(slicer.chunk_size(), ChunkSlicer::DEFAULT_CHUNK_SIZE);
}

TEST_F(ChunkSlicerTest, SlicesFullAndTrailingChunks) {
    ChunkSlicer slicer(temp / "chunks", 1000);

    auto first = slicer.slice(source, 0, content.size());
    EXPECT_EQ(first.offset, 0u);
    EXPECT_EQ(first.length, 1000u);
    EXPECT_EQ(read_file(first.path), content.substr(0, 1000));
    EXPECT_EQ(first.path.parent_path(), temp / "chunks");
    EXPECT_EQ(first.path.extension(), ".bin");

    auto last = slicer.slice(source, 2000, content.size());
    EXPECT_EQ(last.length, 500u);
    EXPECT_EQ(read_file(last.path), content.substr(2000));

    EXPECT_NE(first.path, last.path);
}

TEST_F(ChunkSlicerTest, OffsetAtEndIsRejected) {
    ChunkSlicer slicer(temp.path(), 1000);
    EXPECT_THROW(slicer.slice(source, content.size(), content.size()), ChunkIoError);
}

TEST_F(ChunkSlicerTest, MissingSourceIsRejected) {
    ChunkSlicer slicer(temp.path(), 1000);
    EXPECT_THROW(slicer.slice(temp / "gone.mp4", 0, 100), ChunkIoError);
}

TEST_F(ChunkSlicerTest, ShortReadIsRejected) {
    ChunkSlicer slicer(temp.path(), 1000);
    // Claims more bytes than the file holds.
    EXPECT_THROW(slicer.slice(source, 2000, 4000), ChunkIoError);
}
