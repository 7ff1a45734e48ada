#include "mcp/StdioTransport.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace dg_mcp;

TEST(StdioTransportTest, ReadsLinesUntilEnd) {
    std::istringstream in("first\nsecond\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    ReadResult first = transport.read_line();
    EXPECT_EQ(first.status, ReadStatus::LINE);
    EXPECT_EQ(first.line, "first");

    ReadResult second = transport.read_line();
    EXPECT_EQ(second.status, ReadStatus::LINE);
    EXPECT_EQ(second.line, "second");

    EXPECT_EQ(transport.read_line().status, ReadStatus::END_OF_STREAM);
}

TEST(StdioTransportTest, LastLineWithoutTerminator) {
    std::istringstream in("only");
    std::ostringstream out;
    StdioTransport transport(in, out);

    ReadResult read = transport.read_line();
    EXPECT_EQ(read.status, ReadStatus::LINE);
    EXPECT_EQ(read.line, "only");
    EXPECT_EQ(transport.read_line().status, ReadStatus::END_OF_STREAM);
}

TEST(StdioTransportTest, StripsCarriageReturn) {
    std::istringstream in("{\"a\":1}\r\n\r\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    EXPECT_EQ(transport.read_line().line, "{\"a\":1}");
    ReadResult blank = transport.read_line();
    EXPECT_EQ(blank.status, ReadStatus::LINE);
    EXPECT_TRUE(blank.line.empty());
}

TEST(StdioTransportTest, BadStreamReportsError) {
    std::istringstream in("data\n");
    in.setstate(std::ios::badbit);
    std::ostringstream out;
    StdioTransport transport(in, out);

    EXPECT_EQ(transport.read_line().status, ReadStatus::ERROR);
    EXPECT_FALSE(transport.is_open());
}

TEST(StdioTransportTest, WritesTerminatedLines) {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);

    EXPECT_TRUE(transport.write_line("{\"x\":1}"));
    EXPECT_TRUE(transport.write_line("{\"x\":2}"));
    EXPECT_EQ(out.str(), "{\"x\":1}\n{\"x\":2}\n");
}

TEST(StdioTransportTest, FailedWriteReported) {
    std::istringstream in;
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StdioTransport transport(in, out);

    EXPECT_FALSE(transport.write_line("{}"));
}
