#include <gtest/gtest.h>
#include "io/BlockReader.hpp"
#include "io/MemoryReader.hpp"

TEST(BlockReader, zero_block_size) {
    MemoryReader source(std::string("abc"));
    EXPECT_THROW(BlockReader(source, 0), std::invalid_argument);
}

TEST(BlockReader, empty_source) {
    MemoryReader source((std::string()));
    BlockReader blocks(source, 4);
    EXPECT_EQ(0, blocks.block_count());
    EXPECT_THROW(blocks.read_block(0), std::out_of_range);
}

TEST(BlockReader, blocks_are_aligned_to_file_start) {
    MemoryReader source(std::string("0123456789"));
    BlockReader blocks(source, 4);

    ASSERT_EQ(3, blocks.block_count());
    EXPECT_EQ("89", blocks.read_block(0).to_string());
    EXPECT_EQ("4567", blocks.read_block(1).to_string());
    EXPECT_EQ("0123", blocks.read_block(2).to_string());

    EXPECT_EQ(8, blocks.block_start(0));
    EXPECT_EQ(10, blocks.block_end(0));
    EXPECT_EQ(0, blocks.block_start(2));
    EXPECT_THROW(blocks.block_start(3), std::out_of_range);
}

TEST(BlockReader, exact_multiple) {
    MemoryReader source(std::string("12345678"));
    BlockReader blocks(source, 4);

    ASSERT_EQ(2, blocks.block_count());
    EXPECT_EQ("5678", blocks.read_block(0).to_string());
    EXPECT_EQ("1234", blocks.read_block(1).to_string());
}

TEST(BlockReader, block_larger_than_source) {
    MemoryReader source(std::string("abc"));
    BlockReader blocks(source, 4096);

    ASSERT_EQ(1, blocks.block_count());
    EXPECT_EQ("abc", blocks.read_block(0).to_string());
}

TEST(BlockReader, seek) {
    MemoryReader source(std::string("0123456789"));
    BlockReader blocks(source, 4);

    blocks.seek(6);
    EXPECT_EQ(6, blocks.end());
    ASSERT_EQ(2, blocks.block_count());
    EXPECT_EQ("45", blocks.read_block(0).to_string());
    EXPECT_EQ("0123", blocks.read_block(1).to_string());

    blocks.seek(0);
    EXPECT_EQ(0, blocks.block_count());
}

TEST(BlockReader, seek_out_of_range) {
    MemoryReader source(std::string("0123456789"));
    BlockReader blocks(source, 4);

    EXPECT_THROW(blocks.seek(-1), std::invalid_argument);
    EXPECT_THROW(blocks.seek(11), std::invalid_argument);
    EXPECT_EQ(10, blocks.end());
}

TEST(BlockReader, closed_source) {
    MemoryReader source(std::string("0123456789"));
    BlockReader blocks(source, 4);
    source.close();

    EXPECT_THROW(blocks.read_block(0), ByteSource::ReadError);
}

// source that reports a larger size than it can deliver
class TruncatedSource : public MemoryReader {
    public:
    TruncatedSource() : MemoryReader(std::string("0123")) {}
    size_t size() const override { return 8; }
};

TEST(BlockReader, short_read) {
    TruncatedSource source;
    BlockReader blocks(source, 4);

    EXPECT_THROW(blocks.read_block(0), ByteSource::ReadError);
}
