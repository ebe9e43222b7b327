#pragma once

#include "delivery_types.hpp"
#include "../network/http_client.hpp"
#include "../network/wire.hpp"
#include "../storage/offset_store.hpp"
#include "../transfer/background_transfer_bridge.hpp"
#include "../transfer/chunk_slicer.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace postrelay::delivery {

// One resumable chunked transfer, owned by the submit() call driving it.
struct TransferSession {
    std::string session_id;
    uint64_t total_bytes = 0;
    uint64_t next_offset = 0;
    bool complete = false;

    double fraction() const {
        return total_bytes == 0 ? 0.0 : static_cast<double>(next_offset) / static_cast<double>(total_bytes);
    }
};

// Uploads a video in fixed-size chunks through the background bridge,
// resuming from the furthest offset known locally or remotely.
class ResumableUploader {
public:
    static constexpr int MAX_CHUNK_ATTEMPTS = 5;
    static constexpr double MAX_UNFINISHED_PROGRESS = 0.99;

    ResumableUploader(network::HttpClient& client,
                      transfer::BackgroundTransferBridge& bridge,
                      storage::OffsetStore& offsets,
                      transfer::ChunkSlicer slicer,
                      Sleeper sleeper = default_sleeper());

    static StrategyProfile profile();

    std::vector<network::ContentItem> fetch_timeline();
    DeliveryResult submit(const SubmitRequest& request, const ProgressCallback& progress = nullptr);

    const transfer::ChunkSlicer& slicer() const { return slicer_; }

private:
    // Monotonic, clamped progress for a single submission.
    class ProgressTracker {
    public:
        explicit ProgressTracker(const ProgressCallback& callback) : callback_(callback) {}

        void report(double value);
        void finish();

    private:
        const ProgressCallback& callback_;
        double last_ = 0.0;
    };

    network::HttpClient& client_;
    transfer::BackgroundTransferBridge& bridge_;
    storage::OffsetStore& offsets_;
    transfer::ChunkSlicer slicer_;
    Sleeper sleeper_;

    TransferSession start_session(const std::string& text, const std::filesystem::path& video, uint64_t total_bytes);
    // Returns the offset the server reports after a successful chunk.
    uint64_t upload_chunk(const TransferSession& session, const std::filesystem::path& video,
                          ProgressTracker& tracker);
    uint64_t fetch_remote_offset(const std::string& session_id);
    void complete_session(const std::string& session_id, const std::string& text);

    uint64_t stored_offset(const std::string& session_id);
    void store_offset(const std::string& session_id, uint64_t offset);
    void clear_offset(const std::string& session_id);

    static std::string session_path(const std::string& session_id);
};

}
