#include <gtest/gtest.h>
#include "postrelay/delivery/resumable_uploader.hpp"
#include "postrelay/transfer/transfer_channel.hpp"
#include "support/scripted_transport.hpp"
#include "support/temp_dir.hpp"
#include <algorithm>

using namespace postrelay;
using namespace postrelay::delivery;
using namespace postrelay::test_support;
using network::HttpRequest;
using network::HttpResponse;

namespace {

constexpr uint64_t CHUNK = 1000;

HttpResponse accept_chunk(const HttpRequest& request) {
    auto offset = std::stoull(request.headers.get("Upload-Offset").value_or("0"));
    return make_response(200, "", {{"Upload-Offset", std::to_string(offset + request.body.size())}});
}

ScriptedTransport::Handler session_status(uint64_t offset, uint64_t total) {
    return respond(200, "{\"sessionId\":\"s-1\",\"offset\":" + std::to_string(offset) +
                        ",\"totalBytes\":" + std::to_string(total) + ",\"complete\":false}");
}

}

class ResumableUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 2500; ++i) {
            content.push_back(static_cast<char>('A' + (i % 26)));
        }
        video = temp.write_file("clip.mp4", content);

        db = std::make_unique<storage::Database>(temp / "state.db");
        db->open();
        offsets = std::make_unique<storage::OffsetStore>(*db);
        offsets->initialize();

        channel = std::make_unique<transfer::AsioTransferChannel>(transport);
        bridge = std::make_unique<transfer::BackgroundTransferBridge>(*channel);
        uploader = std::make_unique<ResumableUploader>(
            client, *bridge, *offsets, transfer::ChunkSlicer(temp / "chunks", CHUNK),
            [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); });

        transport.on("POST", "/level3/uploads/start", respond(200, "{\"sessionId\":\"s-1\",\"nextOffset\":0}"));
        transport.on("PUT", "/level3/uploads/s-1/chunk", accept_chunk);
        transport.on("POST", "/level3/uploads/s-1/complete", respond(201, "{\"id\":\"t-9\"}"));
    }

    void TearDown() override {
        channel->join();
        uploader.reset();
        bridge.reset();
        channel.reset();
    }

    SubmitRequest video_request() {
        SubmitRequest request;
        request.text = "a clip";
        request.video_path = video;
        return request;
    }

    std::vector<uint64_t> chunk_offsets() const {
        std::vector<uint64_t> result;
        for (const auto& request : transport.requests_to("PUT", "/level3/uploads/s-1/chunk")) {
            result.push_back(std::stoull(*request.headers.get("Upload-Offset")));
        }
        return result;
    }

    size_t leftover_chunks() const {
        auto dir = temp / "chunks";
        if (!std::filesystem::exists(dir)) {
            return 0;
        }
        return static_cast<size_t>(std::distance(std::filesystem::directory_iterator(dir),
                                                 std::filesystem::directory_iterator()));
    }

    TempDir temp;
    std::string content;
    std::filesystem::path video;
    ScriptedTransport transport;
    network::HttpClient client{transport};
    std::unique_ptr<storage::Database> db;
    std::unique_ptr<storage::OffsetStore> offsets;
    std::unique_ptr<transfer::AsioTransferChannel> channel;
    std::unique_ptr<transfer::BackgroundTransferBridge> bridge;
    std::unique_ptr<ResumableUploader> uploader;
    std::vector<std::chrono::milliseconds> sleeps;
};

TEST_F(ResumableUploaderTest, Profile) {
    auto profile = ResumableUploader::profile();
    EXPECT_EQ(profile.title, "Resumable + Background");
    EXPECT_EQ(profile.level_tag, "level3");
    EXPECT_TRUE(profile.supports_video);
    EXPECT_FALSE(profile.shows_retry_selector);
}

TEST_F(ResumableUploaderTest, UploadsEveryChunkThenCompletes) {
    std::vector<double> progress;
    auto result = uploader->submit(video_request(), [&progress](double f) { progress.push_back(f); });

    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(chunk_offsets(), (std::vector<uint64_t>{0, 1000, 2000}));

    std::string uploaded;
    for (const auto& request : transport.requests_to("PUT", "/level3/uploads/s-1/chunk")) {
        EXPECT_EQ(request.headers.get("Upload-Length"), std::optional<std::string>("2500"));
        uploaded += request.body;
    }
    EXPECT_EQ(uploaded, content);

    auto start = transport.requests_to("POST", "/level3/uploads/start");
    ASSERT_EQ(start.size(), 1u);
    EXPECT_NE(start[0].body.find("\"filename\":\"clip.mp4\""), std::string::npos);
    EXPECT_NE(start[0].body.find("\"totalBytes\":2500"), std::string::npos);
    EXPECT_EQ(transport.count("POST", "/level3/uploads/s-1/complete"), 1u);

    ASSERT_FALSE(progress.empty());
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);
    for (size_t i = 0; i + 1 < progress.size(); ++i) {
        EXPECT_LE(progress[i], ResumableUploader::MAX_UNFINISHED_PROGRESS);
    }

    EXPECT_EQ(offsets->offset("s-1"), 0u);
    EXPECT_TRUE(offsets->all().empty());
    EXPECT_EQ(leftover_chunks(), 0u);
    EXPECT_EQ(bridge->pending_count(), 0u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(ResumableUploaderTest, ResumesFromStoredOffset) {
    offsets->set("s-1", 1000);

    ASSERT_TRUE(uploader->submit(video_request()));
    EXPECT_EQ(chunk_offsets(), (std::vector<uint64_t>{1000, 2000}));
}

TEST_F(ResumableUploaderTest, ResumesFromFurthestOfServerAndStoredOffsets) {
    offsets->set("s-1", 1000);
    transport.on("POST", "/level3/uploads/start", respond(200, "{\"sessionId\":\"s-1\",\"nextOffset\":2000}"));

    ASSERT_TRUE(uploader->submit(video_request()));
    EXPECT_EQ(chunk_offsets(), (std::vector<uint64_t>{2000}));
}

TEST_F(ResumableUploaderTest, SignedUploadOffsetHeaderFallsBackToChunkEnd) {
    transport.on("PUT", "/level3/uploads/s-1/chunk", respond(204, "", {{"Upload-Offset", "-1"}}));
    transport.on("POST", "/level3/uploads/s-1/complete", respond(409, "{\"message\":\"incomplete\"}"));

    auto result = uploader->submit(video_request());

    EXPECT_EQ(result.error, DeliveryError::TERMINAL);
    EXPECT_EQ(chunk_offsets(), (std::vector<uint64_t>{0, 1000, 2000}));
    EXPECT_EQ(transport.count("POST", "/level3/uploads/s-1/complete"), 1u);
    EXPECT_EQ(offsets->offset("s-1"), 2500u);
}

TEST_F(ResumableUploaderTest, UploadOffsetPastTotalIsIgnored) {
    transport.on("PUT", "/level3/uploads/s-1/chunk", respond(204, "", {{"Upload-Offset", "99999"}}));
    transport.on("POST", "/level3/uploads/s-1/complete", respond(409, "{\"message\":\"incomplete\"}"));

    auto result = uploader->submit(video_request());

    EXPECT_EQ(result.error, DeliveryError::TERMINAL);
    EXPECT_EQ(chunk_offsets(), (std::vector<uint64_t>{0, 1000, 2000}));
    EXPECT_EQ(offsets->offset("s-1"), 2500u);
}

TEST_F(ResumableUploaderTest, UploadOffsetOverflowingIntegerIsIgnored) {
    transport.on("PUT", "/level3/uploads/s-1/chunk",
                 respond(204, "", {{"Upload-Offset", "184467440737095516160"}}));

    ASSERT_TRUE(uploader->submit(video_request()));
    EXPECT_EQ(chunk_offsets(), (std::vector<uint64_t>{0, 1000, 2000}));
}

TEST_F(ResumableUploaderTest, FailedChunkReconcilesWithServerOffset) {
    transport.on_sequence("PUT", "/level3/uploads/s-1/chunk", {respond(503), accept_chunk});
    transport.on("GET", "/level3/uploads/s-1", session_status(2000, 2500));

    ASSERT_TRUE(uploader->submit(video_request()));

    EXPECT_EQ(chunk_offsets(), (std::vector<uint64_t>{0, 2000}));
    EXPECT_EQ(transport.count("GET", "/level3/uploads/s-1"), 1u);
    EXPECT_EQ(sleeps, (std::vector<std::chrono::milliseconds>{std::chrono::seconds(1)}));
    EXPECT_EQ(leftover_chunks(), 0u);
}

TEST_F(ResumableUploaderTest, ServerAlreadyHoldingEverythingSkipsToComplete) {
    transport.on_sequence("PUT", "/level3/uploads/s-1/chunk", {respond(500), accept_chunk});
    transport.on("GET", "/level3/uploads/s-1", session_status(2500, 2500));

    ASSERT_TRUE(uploader->submit(video_request()));
    EXPECT_EQ(chunk_offsets(), (std::vector<uint64_t>{0}));
    EXPECT_EQ(transport.count("POST", "/level3/uploads/s-1/complete"), 1u);
}

TEST_F(ResumableUploaderTest, ChunkRetriesExhaust) {
    transport.on("PUT", "/level3/uploads/s-1/chunk", respond(500));
    transport.on("GET", "/level3/uploads/s-1", session_status(0, 2500));

    auto result = uploader->submit(video_request());

    EXPECT_EQ(result.error, DeliveryError::TERMINAL);
    EXPECT_EQ(result.message, "Resumable upload failed after 5 retries for one chunk.");
    EXPECT_EQ(transport.count("PUT", "/level3/uploads/s-1/chunk"), 5u);
    EXPECT_EQ(sleeps.size(), 4u);
    EXPECT_EQ(sleeps.back(), std::chrono::seconds(4));
    EXPECT_EQ(transport.count("POST", "/level3/uploads/s-1/complete"), 0u);
    EXPECT_EQ(leftover_chunks(), 0u);
}

TEST_F(ResumableUploaderTest, StatusQueryFailureAborts) {
    transport.on("PUT", "/level3/uploads/s-1/chunk", respond(500));
    transport.on("GET", "/level3/uploads/s-1", respond(404, "{\"message\":\"unknown session\"}"));

    auto result = uploader->submit(video_request());

    EXPECT_EQ(result.error, DeliveryError::TERMINAL);
    EXPECT_EQ(transport.count("PUT", "/level3/uploads/s-1/chunk"), 1u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(ResumableUploaderTest, CompletionRejectionKeepsStoredOffset) {
    transport.on("POST", "/level3/uploads/s-1/complete", respond(409, "{\"message\":\"incomplete\"}"));

    auto result = uploader->submit(video_request());

    EXPECT_EQ(result.error, DeliveryError::TERMINAL);
    EXPECT_EQ(offsets->offset("s-1"), 2500u);
}

TEST_F(ResumableUploaderTest, StartFailureSendsNoChunks) {
    transport.on("POST", "/level3/uploads/start", fail_connect());

    auto result = uploader->submit(video_request());

    EXPECT_EQ(result.error, DeliveryError::TERMINAL);
    EXPECT_EQ(result.message, "Connection refused");
    EXPECT_EQ(transport.count("PUT", "/level3/uploads/s-1/chunk"), 0u);
}

TEST_F(ResumableUploaderTest, ValidationFailuresSendNothing) {
    SubmitRequest no_video;
    no_video.text = "text only";
    auto result = uploader->submit(no_video);
    EXPECT_EQ(result.error, DeliveryError::VALIDATION);
    EXPECT_EQ(result.message, "Level 3 requires selecting a video before posting.");

    auto missing = video_request();
    missing.video_path = temp / "nope.mp4";
    result = uploader->submit(missing);
    EXPECT_EQ(result.error, DeliveryError::VALIDATION);
    EXPECT_EQ(result.message, "Cannot read the selected video: " + (temp / "nope.mp4").string());

    auto empty = video_request();
    empty.video_path = temp.write_file("empty.mp4", "");
    result = uploader->submit(empty);
    EXPECT_EQ(result.error, DeliveryError::VALIDATION);
    EXPECT_EQ(result.message, "Selected video is empty.");

    EXPECT_TRUE(transport.requests().empty());
}
