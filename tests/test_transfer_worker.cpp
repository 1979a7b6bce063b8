/**
 * @file test_transfer_worker.cpp
 * @brief Tests for a single streaming transfer against the mock HTTP client
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "TestSupport.hpp"
#include "mediagrab/MockHttpClient.hpp"
#include "mediagrab/TransferWorker.hpp"

using namespace mediagrab;
using mediagrab_test::EventRecorder;
using mediagrab_test::ScratchDir;
using mediagrab_test::makeBody;

namespace fs = std::filesystem;

namespace {

const char* kUrl = "http://host/song.mp3";

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<int> progressValues(const std::vector<ItemEvent>& events) {
    std::vector<int> out;
    for (const auto& ev : events) {
        if (ev.type == ItemEvent::Type::Progress) out.push_back(ev.percent);
    }
    return out;
}

}  // namespace

TEST(TransferWorker, CompletesAndWritesBody) {
    ScratchDir dir;
    auto http = std::make_shared<MockHttpClient>();
    MockHttpClient::Resource res;
    res.body = makeBody(4000);
    res.chunkSize = 1000;
    http->addResource(kUrl, res);

    EventRecorder rec;
    const std::string dest = dir.file("sub/Song.mp3");
    {
        TransferWorker w(7, kUrl, dest, http, rec.callback());
        w.start();
        ASSERT_TRUE(rec.waitForStatus(7, ItemStatus::Completed));
    }

    const auto events = rec.events();
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events.front().type, ItemEvent::Type::Status);
    EXPECT_EQ(events.front().status, ItemStatus::Downloading);
    EXPECT_EQ(events.back().status, ItemStatus::Completed);
    EXPECT_EQ(progressValues(events), (std::vector<int>{25, 50, 75, 100}));
    EXPECT_EQ(readFile(dest), res.body);
}

TEST(TransferWorker, UnknownLengthReportsZeroProgress) {
    ScratchDir dir;
    auto http = std::make_shared<MockHttpClient>();
    MockHttpClient::Resource res;
    res.body = makeBody(3000);
    res.chunkSize = 1000;
    res.reportLength = false;
    http->addResource(kUrl, res);

    EventRecorder rec;
    const std::string dest = dir.file("a.mp3");
    {
        TransferWorker w(1, kUrl, dest, http, rec.callback());
        w.start();
        ASSERT_TRUE(rec.waitForStatus(1, ItemStatus::Completed));
    }
    EXPECT_EQ(progressValues(rec.events()), (std::vector<int>{0, 0, 0}));
    EXPECT_EQ(fs::file_size(dest), 3000u);
}

TEST(TransferWorker, HttpErrorCreatesNoFile) {
    ScratchDir dir;
    auto http = std::make_shared<MockHttpClient>();
    EventRecorder rec;
    const std::string dest = dir.file("missing.mp3");
    {
        TransferWorker w(2, "http://host/missing.mp3", dest, http, rec.callback());
        w.start();
        ASSERT_TRUE(rec.waitForStatus(2, ItemStatus::Error));
    }
    const auto last = rec.events().back();
    EXPECT_EQ(last.error, ErrorKind::HttpStatus);
    EXPECT_FALSE(fs::exists(dest));
}

TEST(TransferWorker, ServerErrorStatus) {
    ScratchDir dir;
    auto http = std::make_shared<MockHttpClient>();
    MockHttpClient::Resource res;
    res.body = "oops";
    res.httpStatus = 500;
    http->addResource(kUrl, res);

    EventRecorder rec;
    {
        TransferWorker w(3, kUrl, dir.file("x.mp3"), http, rec.callback());
        w.start();
        ASSERT_TRUE(rec.waitForStatus(3, ItemStatus::Error));
    }
    EXPECT_EQ(rec.events().back().error, ErrorKind::HttpStatus);
    EXPECT_NE(rec.events().back().message.find("500"), std::string::npos);
}

TEST(TransferWorker, NetworkFailureMidStream) {
    ScratchDir dir;
    auto http = std::make_shared<MockHttpClient>();
    MockHttpClient::Resource res;
    res.body = makeBody(5000);
    res.chunkSize = 1000;
    res.failAfterBytes = 2000;
    http->addResource(kUrl, res);

    EventRecorder rec;
    const std::string dest = dir.file("x.mp3");
    {
        TransferWorker w(4, kUrl, dest, http, rec.callback());
        w.start();
        ASSERT_TRUE(rec.waitForStatus(4, ItemStatus::Error));
    }
    EXPECT_EQ(rec.events().back().error, ErrorKind::Network);
    EXPECT_EQ(fs::file_size(dest), 2000u);
}

TEST(TransferWorker, StopBetweenChunksKeepsPartialFile) {
    ScratchDir dir;
    auto http = std::make_shared<MockHttpClient>();
    MockHttpClient::Resource res;
    res.body = makeBody(10000);
    res.chunkSize = 1000;
    res.gateAfterChunks = 3;
    http->addResource(kUrl, res);

    EventRecorder rec;
    const std::string dest = dir.file("x.mp3");
    {
        TransferWorker w(5, kUrl, dest, http, rec.callback());
        w.start();
        ASSERT_TRUE(http->waitForGate(kUrl));
        w.stop();
        EXPECT_TRUE(w.stopRequested());
        http->openGate(kUrl);
        ASSERT_TRUE(rec.waitForStatus(5, ItemStatus::Paused));
    }
    EXPECT_EQ(fs::file_size(dest), 3000u);
    EXPECT_EQ(rec.countStatus(ItemStatus::Completed), 0);
}

TEST(TransferWorker, StopEndsStalledTransfer) {
    ScratchDir dir;
    auto http = std::make_shared<MockHttpClient>();
    MockHttpClient::Resource res;
    res.body = makeBody(10000);
    res.chunkSize = 1000;
    res.gateAfterChunks = 2;
    res.abortableGate = true;
    http->addResource(kUrl, res);

    EventRecorder rec;
    const std::string dest = dir.file("stalled.mp3");
    {
        TransferWorker w(6, kUrl, dest, http, rec.callback());
        w.start();
        ASSERT_TRUE(http->waitForGate(kUrl));
        // No more data ever arrives; the gate stays closed
        w.stop();
        ASSERT_TRUE(rec.waitForStatus(6, ItemStatus::Paused));
    }
    EXPECT_EQ(fs::file_size(dest), 2000u);
    EXPECT_EQ(rec.countStatus(ItemStatus::Error), 0);
    EXPECT_EQ(http->activeGets(), 0);
}

TEST(TransferWorker, StopBeforeStartNeverRequests) {
    ScratchDir dir;
    auto http = std::make_shared<MockHttpClient>();
    MockHttpClient::Resource res;
    res.body = makeBody(100);
    http->addResource(kUrl, res);

    EventRecorder rec;
    const std::string dest = dir.file("x.mp3");
    {
        TransferWorker w(6, kUrl, dest, http, rec.callback());
        w.stop();
        w.start();
        ASSERT_TRUE(rec.waitForStatus(6, ItemStatus::Paused));
    }
    EXPECT_EQ(http->getCount(kUrl), 0);
    EXPECT_FALSE(fs::exists(dest));
}

TEST(TransferWorker, UnwritableDestinationIsFilesystemError) {
    ScratchDir dir;
    // A regular file where a parent folder is expected
    std::ofstream(dir.file("blocker")) << "x";

    auto http = std::make_shared<MockHttpClient>();
    MockHttpClient::Resource res;
    res.body = makeBody(100);
    http->addResource(kUrl, res);

    EventRecorder rec;
    {
        TransferWorker w(8, kUrl, dir.file("blocker/x.mp3"), http, rec.callback());
        w.start();
        ASSERT_TRUE(rec.waitForStatus(8, ItemStatus::Error));
    }
    EXPECT_EQ(rec.events().back().error, ErrorKind::Filesystem);
}
