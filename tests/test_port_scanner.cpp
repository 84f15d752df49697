/// @file test_port_scanner.cpp
/// Unit tests for port_scanner.hpp: finding the announced port in a stream.

#include "errors.hpp"
#include "fakes.hpp"
#include "port_scanner.hpp"

#include <gtest/gtest.h>

using namespace kube_auth_proxy;
using namespace kube_auth_proxy::fakes;

namespace {

struct ScanResult {
    std::shared_ptr<TaskResult> task;
    uint16_t                    port = 0;
};

/// Starts a scan and feeds @p feed from the io_context once it is waiting.
ScanResult runScan(net::io_context& ioc,
                   PortFromStreamScanner& scanner,
                   std::function<void()> feed) {
    ScanResult r;
    auto port = std::make_shared<uint16_t>(0);
    r.task = launch(ioc, [&scanner, port](net::yield_context yield) {
        *port = scanner.scan(yield);
    });
    net::post(ioc, std::move(feed));
    ioc.run();
    r.port = *port;
    return r;
}

} // namespace

// ============================================================================
// Successful discovery
// ============================================================================

TEST(PortScanner, FindsPortAfterNoise) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    int found = 0;
    PortFromStreamScanner scanner(ioc, stream,
                                  PortFromStreamScanner::startingServeOptions([&] { ++found; }));

    auto r = runScan(ioc, scanner, [stream] {
        stream->push("loading kubeconfig\n");
        stream->push("Starting to serve on 127.0.0.1:8443\n");
        stream->push("starting to serve on 127.0.0.1:9999\n");
    });

    ASSERT_TRUE(r.task->done);
    EXPECT_FALSE(r.task->error);
    EXPECT_EQ(r.port, 8443);
    EXPECT_EQ(found, 1);
    EXPECT_EQ(stream->listenerCount(), 0u);
}

TEST(PortScanner, LineSplitAcrossChunks) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    PortFromStreamScanner scanner(ioc, stream, PortFromStreamScanner::startingServeOptions());

    auto r = runScan(ioc, scanner, [stream] {
        stream->push("starting to se");
        stream->push("rve on 127.0.0.1:40");
        stream->push("123\r\n");
    });

    EXPECT_FALSE(r.task->error);
    EXPECT_EQ(r.port, 40123);
}

TEST(PortScanner, MatchIsCaseInsensitive) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    PortFromStreamScanner scanner(ioc, stream, PortFromStreamScanner::startingServeOptions());

    auto r = runScan(ioc, scanner, [stream] {
        stream->push("STARTING TO SERVE ON [::1]:5000\n");
    });

    EXPECT_FALSE(r.task->error);
    EXPECT_EQ(r.port, 5000);
}

TEST(PortScanner, FinalLineWithoutNewlineCountsAtEnd) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    PortFromStreamScanner scanner(ioc, stream, PortFromStreamScanner::startingServeOptions());

    auto r = runScan(ioc, scanner, [stream] {
        stream->push("starting to serve on 127.0.0.1:6001");
        stream->end();
    });

    EXPECT_FALSE(r.task->error);
    EXPECT_EQ(r.port, 6001);
}

TEST(PortScanner, MatchWithoutUsablePortIsSkipped) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    PortFromStreamScanner scanner(ioc, stream, PortFromStreamScanner::startingServeOptions());

    auto r = runScan(ioc, scanner, [stream] {
        stream->push("starting to serve on unix:/tmp/socket\n");
        stream->push("starting to serve on 127.0.0.1:7002\n");
    });

    EXPECT_FALSE(r.task->error);
    EXPECT_EQ(r.port, 7002);
}

TEST(PortScanner, CustomPatternAndGroup) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    PortFromStreamScanner::Options options;
    options.lineRegex    = boost::regex("listening at (?<where>\\S+)");
    options.captureGroup = "where";
    PortFromStreamScanner scanner(ioc, stream, std::move(options));

    auto r = runScan(ioc, scanner, [stream] {
        stream->push("listening at localhost:3000 (http)\n");
    });

    EXPECT_FALSE(r.task->error);
    EXPECT_EQ(r.port, 3000);
}

// ============================================================================
// Failure
// ============================================================================

TEST(PortScanner, StreamEndWithoutMatchFails) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    bool found = false;
    PortFromStreamScanner scanner(ioc, stream,
                                  PortFromStreamScanner::startingServeOptions([&] { found = true; }));

    auto r = runScan(ioc, scanner, [stream] {
        stream->push("error: unable to load kubeconfig\n");
        stream->end();
    });

    ASSERT_TRUE(r.task->done);
    EXPECT_TRUE(r.task->failedWith<PortDiscoveryFailed>());
    EXPECT_FALSE(found);
    EXPECT_EQ(stream->listenerCount(), 0u);
}

TEST(PortScanner, AlreadyEndedStreamFails) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    stream->end();
    PortFromStreamScanner scanner(ioc, stream, PortFromStreamScanner::startingServeOptions());

    auto r = runScan(ioc, scanner, [] {});

    EXPECT_TRUE(r.task->failedWith<PortDiscoveryFailed>());
}

TEST(PortScanner, CancelFailsPendingScan) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    PortFromStreamScanner scanner(ioc, stream, PortFromStreamScanner::startingServeOptions());

    auto r = runScan(ioc, scanner, [&scanner] { scanner.cancel(); });

    EXPECT_TRUE(r.task->failedWith<PortDiscoveryFailed>());
    EXPECT_EQ(stream->listenerCount(), 0u);
}

TEST(PortScanner, CancelBeforeScanFails) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    PortFromStreamScanner scanner(ioc, stream, PortFromStreamScanner::startingServeOptions());
    scanner.cancel();

    auto r = runScan(ioc, scanner, [stream] {
        stream->push("starting to serve on 127.0.0.1:8443\n");
    });

    EXPECT_TRUE(r.task->failedWith<PortDiscoveryFailed>());
}

TEST(PortScanner, SecondScanIsRejected) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    PortFromStreamScanner scanner(ioc, stream, PortFromStreamScanner::startingServeOptions());

    auto first = runScan(ioc, scanner, [stream] {
        stream->push("starting to serve on 127.0.0.1:8443\n");
    });
    EXPECT_EQ(first.port, 8443);

    ioc.restart();
    auto second = runScan(ioc, scanner, [] {});
    EXPECT_TRUE(second.task->failedWith<std::logic_error>());
}

TEST(PortScanner, ErrorMessageNamesStream) {
    net::io_context ioc;
    auto stream = std::make_shared<OutputStream>();
    PortFromStreamScanner scanner(ioc, stream, PortFromStreamScanner::startingServeOptions());

    auto r = runScan(ioc, scanner, [stream] { stream->end(); });

    ASSERT_TRUE(r.task->error);
    try {
        std::rethrow_exception(r.task->error);
    } catch (const PortDiscoveryFailed& e) {
        EXPECT_NE(std::string(e.what()).find("Could not find port in stream"),
                  std::string::npos);
    }
}
