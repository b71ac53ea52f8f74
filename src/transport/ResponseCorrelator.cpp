#include "cmlink/transport/ResponseCorrelator.hpp"

#include "cmlink/util/Logging.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <stdexcept>

namespace cmlink::transport {

CompletionSlot::CompletionSlot(JobId jobId, Release release)
    : jobId_(jobId)
    , release_(std::move(release)) {}

bool CompletionSlot::complete(ResponseBody body) {
    return resolve(State::fulfilled, std::move(body), nullptr);
}

bool CompletionSlot::fail(std::exception_ptr error) {
    return resolve(State::failed, std::nullopt, std::move(error));
}

bool CompletionSlot::resolve(State state, std::optional<ResponseBody> body, std::exception_ptr error) {
    Waiter waiter;
    {
        std::scoped_lock lock(mutex_);
        if (state_ != State::pending) {
            return false;
        }
        state_ = state;
        body_ = std::move(body);
        error_ = std::move(error);
        waiter = std::move(waiter_);
        waiter_ = nullptr;
    }
    release();
    if (waiter) {
        notify(std::move(waiter));
    }
    return true;
}

void CompletionSlot::asyncWait(boost::asio::io_context& io,
                               std::chrono::steady_clock::duration deadline,
                               std::string kind,
                               Waiter waiter) {
    std::unique_lock lock(mutex_);
    if (waiting_) {
        throw std::logic_error("completion slot for job " + std::to_string(jobId_) + " is already awaited");
    }
    waiting_ = true;
    kind_ = std::move(kind);
    timer_.emplace(boost::asio::make_strand(io));

    if (state_ != State::pending) {
        lock.unlock();
        notify(std::move(waiter));
        return;
    }

    waiter_ = std::move(waiter);
    timer_->expires_after(deadline);
    timer_->async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        self->onDeadline(ec);
    });
}

void CompletionSlot::onDeadline(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }
    Waiter waiter;
    {
        std::scoped_lock lock(mutex_);
        if (state_ != State::pending) {
            return;
        }
        state_ = State::expired;
        waiter = std::move(waiter_);
        waiter_ = nullptr;
    }
    util::log(util::LogLevel::debug, "Timed out waiting for response from " + kind_);
    release();
    waiter(std::make_exception_ptr(
               TransportError(TransportError::Type::timeout, "Timed out waiting for response from " + kind_)),
           ResponseBody{});
}

// Runs on the timer's strand so the cancel never races the deadline handler.
void CompletionSlot::notify(Waiter waiter) {
    boost::asio::post(timer_->get_executor(), [self = shared_from_this(), waiter = std::move(waiter)]() {
        self->timer_->cancel();
        if (self->error_) {
            waiter(self->error_, ResponseBody{});
            return;
        }
        waiter(nullptr, *self->body_);
    });
}

void CompletionSlot::release() {
    if (release_) {
        auto release = std::move(release_);
        release_ = nullptr;
        release(jobId_, this);
    }
}

CompletionSlot::State CompletionSlot::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

ResponseCorrelator::~ResponseCorrelator() {
    failAll("response correlator destroyed");
}

std::shared_ptr<CompletionSlot> ResponseCorrelator::registerRequest(JobId jobId) {
    std::weak_ptr<ResponseCorrelator> weak = weak_from_this();
    auto slot = std::make_shared<CompletionSlot>(jobId, [weak](JobId id, const CompletionSlot* resolved) {
        if (auto correlator = weak.lock()) {
            correlator->release(id, resolved);
        }
    });

    std::scoped_lock lock(mutex_);
    auto [it, inserted] = slots_.emplace(jobId, slot);
    if (!inserted) {
        throw std::invalid_argument("job " + std::to_string(jobId) + " already has a pending request");
    }
    return slot;
}

bool ResponseCorrelator::deliver(JobId jobId, ResponseBody body) {
    std::shared_ptr<CompletionSlot> slot;
    {
        std::scoped_lock lock(mutex_);
        auto it = slots_.find(jobId);
        if (it != slots_.end()) {
            slot = it->second;
        }
    }
    if (!slot || !slot->complete(std::move(body))) {
        util::log(util::LogLevel::debug, "Discarding response for job " + std::to_string(jobId));
        return false;
    }
    return true;
}

std::size_t ResponseCorrelator::failAll(const std::string& reason) {
    std::unordered_map<JobId, std::shared_ptr<CompletionSlot>> slots;
    {
        std::scoped_lock lock(mutex_);
        slots.swap(slots_);
    }
    std::size_t failed = 0;
    for (auto& [jobId, slot] : slots) {
        if (slot->fail(std::make_exception_ptr(TransportError(TransportError::Type::channel_closed, reason)))) {
            ++failed;
        }
    }
    if (failed > 0) {
        util::log(util::LogLevel::debug, "Failed " + std::to_string(failed) + " pending requests: " + reason);
    }
    return failed;
}

std::size_t ResponseCorrelator::pending() const {
    std::scoped_lock lock(mutex_);
    return slots_.size();
}

void ResponseCorrelator::release(JobId jobId, const CompletionSlot* slot) {
    std::scoped_lock lock(mutex_);
    auto it = slots_.find(jobId);
    if (it != slots_.end() && it->second.get() == slot) {
        slots_.erase(it);
    }
}

ReadLoop::ReadLoop(CmReadHalf reader, std::shared_ptr<ResponseCorrelator> correlator, FrameDecoder decoder)
    : reader_(std::move(reader))
    , correlator_(std::move(correlator))
    , decoder_(std::move(decoder)) {}

void ReadLoop::start() {
    readNext();
}

void ReadLoop::stop() {
    CmReadHalf reader;
    {
        std::scoped_lock lock(mutex_);
        stopped_ = true;
        reader = std::move(reader_);
    }
}

void ReadLoop::readNext() {
    std::scoped_lock lock(mutex_);
    if (stopped_ || !reader_.valid()) {
        return;
    }
    reader_.asyncRead([self = shared_from_this()](boost::system::error_code ec, std::string frame) {
        self->onFrame(ec, frame);
    });
}

void ReadLoop::onFrame(const boost::system::error_code& ec, const std::string& frame) {
    if (ec) {
        util::log(stopped_ ? util::LogLevel::debug : util::LogLevel::warn, "CM read loop ended: " + ec.message());
        correlator_->failAll("CM connection closed: " + ec.message());
        return;
    }

    try {
        if (auto reply = decoder_(frame)) {
            correlator_->deliver(reply->first, std::move(reply->second));
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"Skipping undecodable CM frame: "} + ex.what());
    }
    readNext();
}

} // namespace cmlink::transport
