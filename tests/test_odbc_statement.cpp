#include <gtest/gtest.h>
#include "core/statement.hpp"
#include <algorithm>
#include <cstring>
#include <string>

using sproc_mapper::core::read_text_chunks;
using sproc_mapper::core::TextChunkReader;

namespace {

// SQLGetData(SQL_C_CHAR) over one cell, as a driver returns it: pieces of
// capacity - 1 bytes plus a terminator, SQL_SUCCESS_WITH_INFO while data
// remains, then SQL_NO_DATA
class CellSource {
public:
    CellSource(std::string value, bool report_total)
        : value_(std::move(value)), report_total_(report_total) {}

    TextChunkReader reader() {
        return [this](char* buffer, SQLLEN capacity, SQLLEN* indicator) -> SQLRETURN {
            ++calls;
            if (offset_ >= value_.size() && offset_ > 0) {
                return SQL_NO_DATA;
            }
            size_t remaining = value_.size() - offset_;
            size_t piece = std::min(remaining, static_cast<size_t>(capacity - 1));
            std::memcpy(buffer, value_.data() + offset_, piece);
            buffer[piece] = '\0';
            offset_ += piece;

            bool more = piece < remaining;
            *indicator = (more && !report_total_) ? SQL_NO_TOTAL : static_cast<SQLLEN>(remaining);
            if (offset_ == 0) {
                offset_ = 1;  // empty value was returned once
            }
            return more ? SQL_SUCCESS_WITH_INFO : SQL_SUCCESS;
        };
    }

    int calls = 0;

private:
    std::string value_;
    bool report_total_;
    size_t offset_ = 0;
};

std::string long_value(size_t length) {
    std::string value;
    for (size_t i = 0; i < length; ++i) {
        value += static_cast<char>('a' + i % 26);
    }
    return value;
}

} // anonymous namespace

TEST(TextChunkTest, ShortValueInOneRead) {
    CellSource source("alice", true);
    EXPECT_EQ(read_text_chunks(source.reader(), 64), std::optional<std::string>("alice"));
    EXPECT_EQ(source.calls, 1);
}

TEST(TextChunkTest, LongValueWithTotalLength) {
    const auto value = long_value(1000);
    CellSource source(value, true);

    auto text = read_text_chunks(source.reader(), 64);

    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, value);
    // 1000 bytes in 64-byte pieces
    EXPECT_EQ(source.calls, 16);
}

TEST(TextChunkTest, LongValueWithoutTotalLength) {
    const auto value = long_value(130);
    CellSource source(value, false);

    auto text = read_text_chunks(source.reader(), 32);

    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, value);
}

TEST(TextChunkTest, ValueOfExactlyOneChunk) {
    const auto value = long_value(32);
    CellSource source(value, true);

    EXPECT_EQ(read_text_chunks(source.reader(), 32), std::optional<std::string>(value));
    EXPECT_EQ(source.calls, 1);
}

TEST(TextChunkTest, TinyChunkSizeIsRaised) {
    const auto value = long_value(40);
    CellSource source(value, true);
    SQLLEN seen_capacity = 0;

    auto text = read_text_chunks([&](char* buffer, SQLLEN capacity, SQLLEN* indicator) {
        seen_capacity = capacity;
        return source.reader()(buffer, capacity, indicator);
    }, 1);

    EXPECT_EQ(text, std::optional<std::string>(value));
    EXPECT_GE(seen_capacity, 17);
}

TEST(TextChunkTest, EmptyValue) {
    CellSource source("", true);
    EXPECT_EQ(read_text_chunks(source.reader(), 64), std::optional<std::string>(""));
}

TEST(TextChunkTest, NullValue) {
    auto text = read_text_chunks([](char*, SQLLEN, SQLLEN* indicator) -> SQLRETURN {
        *indicator = SQL_NULL_DATA;
        return SQL_SUCCESS;
    }, 64);

    EXPECT_FALSE(text.has_value());
}
