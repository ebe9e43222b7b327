#pragma once

#include "../network/http_transport.hpp"
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace postrelay::transfer {

using TaskId = uint64_t;

// Receives the events of a TransferChannel, possibly on a channel-owned thread.
class TransferChannelDelegate {
public:
    virtual ~TransferChannelDelegate() = default;

    virtual void on_body_data_sent(TaskId task_id, uint64_t total_sent, uint64_t total_expected) = 0;

    // Exactly one of response / error is set.
    virtual void on_task_completed(TaskId task_id,
                                   std::optional<network::HttpResponse> response,
                                   std::exception_ptr error) = 0;

    // Everything queued on the channel has been delivered.
    virtual void on_events_finished() = 0;
};

// The process-wide background upload mechanism. Exactly one instance exists;
// the application constructs it and hands it to the bridge by reference.
class TransferChannel {
public:
    virtual ~TransferChannel() = default;

    virtual const std::string& identifier() const = 0;
    virtual void set_delegate(TransferChannelDelegate* delegate) = 0;

    // Creates a suspended task uploading `file` as the body of `request`.
    virtual TaskId create_upload_task(const network::HttpRequest& request,
                                      const std::filesystem::path& file) = 0;
    virtual void resume(TaskId task_id) = 0;

    virtual bool has_task(TaskId task_id) const = 0;
};

class AsioTransferChannel : public TransferChannel {
public:
    static constexpr const char* DEFAULT_IDENTIFIER = "postrelay.level3.background";

    AsioTransferChannel(network::HttpTransport& transport,
                        std::string identifier = DEFAULT_IDENTIFIER,
                        TaskId first_task_id = 1,
                        std::size_t worker_threads = 1);
    ~AsioTransferChannel() override;

    const std::string& identifier() const override { return identifier_; }
    void set_delegate(TransferChannelDelegate* delegate) override;

    TaskId create_upload_task(const network::HttpRequest& request,
                              const std::filesystem::path& file) override;
    void resume(TaskId task_id) override;
    bool has_task(TaskId task_id) const override;

    // Waits for every resumed task to finish.
    void join();

private:
    struct Task {
        network::HttpRequest request;
        std::filesystem::path file;
        bool running = false;
    };

    network::HttpTransport& transport_;
    std::string identifier_;
    boost::asio::thread_pool pool_;

    mutable std::mutex mutex_;
    std::map<TaskId, Task> tasks_;
    TaskId next_task_id_;
    std::size_t running_count_;
    std::atomic<TransferChannelDelegate*> delegate_;

    void run_task(TaskId task_id);
    void finish_task(TaskId task_id);
};

}
