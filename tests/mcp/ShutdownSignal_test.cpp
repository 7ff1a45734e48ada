#include "mcp/MCPServer.hpp"
#include "mcp/ShutdownSignal.hpp"
#include "mcp/StdioTransport.hpp"
#include "mcp/ToolRegistry.hpp"
#include <ext/stdio_sync_filebuf.h>
#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <future>
#include <memory>
#include <sstream>
#include <thread>
#include <pthread.h>
#include <unistd.h>

using namespace dg_mcp;

/**
 * Reads go through a stdio FILE over a pipe, the same buffering std::cin
 * uses, so a read with no data pending blocks in read(2).
 */
class ShutdownSignalTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(fds), 0);
        input = ::fdopen(fds[0], "r");
        ASSERT_NE(input, nullptr);
        buffer = std::make_unique<__gnu_cxx::stdio_sync_filebuf<char>>(input);
        in = std::make_unique<std::istream>(buffer.get());
    }

    void TearDown() override {
        ShutdownSignal::uninstall();
        close_writer();
        in.reset();
        buffer.reset();
        if (input) {
            std::fclose(input);
        }
    }

    void close_writer() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }

    /**
     * Send SIGTERM to the blocked thread until it finishes.
     * On timeout the pipe is closed so the thread can still be joined.
     */
    template <typename T>
    bool interrupt(std::thread& worker, std::future<T>& done) {
        for (int attempt = 0; attempt < 50; ++attempt) {
            if (done.wait_for(std::chrono::milliseconds(100)) == std::future_status::ready) {
                return true;
            }
            ::pthread_kill(worker.native_handle(), SIGTERM);
        }
        bool finished = done.wait_for(std::chrono::milliseconds(100)) == std::future_status::ready;
        if (!finished) {
            close_writer();
        }
        return finished;
    }

    int fds[2] = {-1, -1};
    FILE* input = nullptr;
    std::unique_ptr<__gnu_cxx::stdio_sync_filebuf<char>> buffer;
    std::unique_ptr<std::istream> in;
    std::ostringstream out;
};

TEST_F(ShutdownSignalTest, SignalIsRecorded) {
    ShutdownSignal::install(nullptr);
    EXPECT_FALSE(ShutdownSignal::requested());

    ASSERT_EQ(std::raise(SIGTERM), 0);
    EXPECT_TRUE(ShutdownSignal::requested());

    ShutdownSignal::uninstall();
    EXPECT_FALSE(ShutdownSignal::requested());
}

TEST_F(ShutdownSignalTest, SignalStopsAttachedServer) {
    auto registry = std::make_shared<ToolRegistry>();
    auto transport = std::make_unique<StdioTransport>(*in, out);
    MCPServer server(std::move(transport), std::make_shared<RequestDispatcher>(registry));

    ShutdownSignal::install(&server);
    ASSERT_EQ(std::raise(SIGINT), 0);

    // The pending request flag ends the loop before any read blocks
    EXPECT_TRUE(server.run());
    EXPECT_TRUE(out.str().empty());
}

TEST_F(ShutdownSignalTest, BlockedReadEndsOnSignal) {
    StdioTransport transport(*in, out);
    ShutdownSignal::install(nullptr);

    std::packaged_task<ReadResult()> task([&transport] { return transport.read_line(); });
    std::future<ReadResult> done = task.get_future();
    std::thread reader(std::move(task));

    bool finished = interrupt(reader, done);
    reader.join();

    ASSERT_TRUE(finished);
    EXPECT_EQ(done.get().status, ReadStatus::END_OF_STREAM);
    EXPECT_TRUE(ShutdownSignal::requested());
}

TEST_F(ShutdownSignalTest, IdleServerStopsOnSignal) {
    auto registry = std::make_shared<ToolRegistry>();
    auto transport = std::make_unique<StdioTransport>(*in, out);
    MCPServer server(std::move(transport), std::make_shared<RequestDispatcher>(registry));
    ShutdownSignal::install(&server);

    // One request is answered, then the server waits for more input
    std::string request = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n";
    ASSERT_EQ(::write(fds[1], request.data(), request.size()), static_cast<ssize_t>(request.size()));

    std::packaged_task<bool()> task([&server] { return server.run(); });
    std::future<bool> done = task.get_future();
    std::thread runner(std::move(task));

    bool finished = interrupt(runner, done);
    runner.join();

    ASSERT_TRUE(finished);
    EXPECT_TRUE(done.get());
    EXPECT_NE(out.str().find("\"id\":1"), std::string::npos);
    // The pipe is still open: the loop ended because of the signal, not EOF
    EXPECT_GE(fds[1], 0);
}
