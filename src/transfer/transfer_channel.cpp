#include "postrelay/transfer/transfer_channel.hpp"
#include "postrelay/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <fstream>
#include <iterator>

namespace postrelay::transfer {

AsioTransferChannel::AsioTransferChannel(network::HttpTransport& transport,
                                         std::string identifier,
                                         TaskId first_task_id,
                                         std::size_t worker_threads)
    : transport_(transport)
    , identifier_(std::move(identifier))
    , pool_(worker_threads == 0 ? 1 : worker_threads)
    , next_task_id_(first_task_id == 0 ? 1 : first_task_id)
    , running_count_(0)
    , delegate_(nullptr) {
}

AsioTransferChannel::~AsioTransferChannel() {
    join();
}

void AsioTransferChannel::set_delegate(TransferChannelDelegate* delegate) {
    delegate_.store(delegate);
}

TaskId AsioTransferChannel::create_upload_task(const network::HttpRequest& request,
                                               const std::filesystem::path& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskId task_id = next_task_id_++;
    tasks_[task_id] = Task{request, file, false};
    LOG_TRACE("Channel {} created task {} for {}", identifier_, task_id, file.string());
    return task_id;
}

void AsioTransferChannel::resume(TaskId task_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end() || it->second.running) {
            return;
        }
        it->second.running = true;
        running_count_++;
    }

    boost::asio::post(pool_, [this, task_id]() { run_task(task_id); });
}

bool AsioTransferChannel::has_task(TaskId task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.find(task_id) != tasks_.end();
}

void AsioTransferChannel::join() {
    pool_.join();
}

void AsioTransferChannel::run_task(TaskId task_id) {
    network::HttpRequest request;
    std::filesystem::path file;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            return;
        }
        request = it->second.request;
        file = it->second.file;
    }

    std::optional<network::HttpResponse> response;
    std::exception_ptr error;

    try {
        std::ifstream input(file, std::ios::binary);
        if (!input.is_open()) {
            throw std::runtime_error("Cannot open upload file: " + file.string());
        }
        request.body.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
        if (!request.headers.contains("Content-Type")) {
            request.headers.set("Content-Type", "application/octet-stream");
        }

        uint64_t expected = request.body.size();
        if (auto* delegate = delegate_.load()) {
            delegate->on_body_data_sent(task_id, 0, expected);
        }

        response = transport_.perform(request);

        if (auto* delegate = delegate_.load()) {
            delegate->on_body_data_sent(task_id, expected, expected);
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Channel task {} failed: {}", task_id, e.what());
        response.reset();
        error = std::current_exception();
    }

    if (auto* delegate = delegate_.load()) {
        delegate->on_task_completed(task_id, std::move(response), error);
    }

    finish_task(task_id);
}

void AsioTransferChannel::finish_task(TaskId task_id) {
    bool drained = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.erase(task_id);
        running_count_--;
        drained = running_count_ == 0;
    }

    if (drained) {
        if (auto* delegate = delegate_.load()) {
            delegate->on_events_finished();
        }
    }
}

}
