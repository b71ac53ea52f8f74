#pragma once

#include "cmlink/transport/CmTransport.hpp"
#include "cmlink/transport/TransportError.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace cmlink::transport {

using JobId = std::uint64_t;

inline constexpr std::chrono::seconds kResponseTimeout{5};

struct ResponseBody {
    std::uint32_t kind{};
    std::int32_t result{};
    std::string payload;
};

// Single-use completion for one outstanding request. Exactly one of complete,
// fail or the wait deadline wins; every later attempt is refused.
class CompletionSlot : public std::enable_shared_from_this<CompletionSlot> {
public:
    enum class State {
        pending,
        fulfilled,
        failed,
        expired
    };

    using Waiter = std::function<void(std::exception_ptr, ResponseBody)>;
    using Release = std::function<void(JobId, const CompletionSlot*)>;

    explicit CompletionSlot(JobId jobId, Release release = {});

    CompletionSlot(const CompletionSlot&) = delete;
    CompletionSlot& operator=(const CompletionSlot&) = delete;

    // Returns false when the slot was already resolved or has expired.
    bool complete(ResponseBody body);
    bool fail(std::exception_ptr error);

    // Waits at most deadline. On expiry the waiter receives
    // TransportError(timeout). May be called once.
    void asyncWait(boost::asio::io_context& io,
                   std::chrono::steady_clock::duration deadline,
                   std::string kind,
                   Waiter waiter);

    [[nodiscard]] State state() const;
    [[nodiscard]] JobId jobId() const noexcept { return jobId_; }

private:
    bool resolve(State state, std::optional<ResponseBody> body, std::exception_ptr error);
    void onDeadline(const boost::system::error_code& ec);
    void notify(Waiter waiter);
    void release();

    const JobId jobId_;
    Release release_;

    mutable std::mutex mutex_;
    State state_{State::pending};
    std::optional<ResponseBody> body_;
    std::exception_ptr error_;
    std::string kind_;
    Waiter waiter_;
    std::optional<boost::asio::steady_timer> timer_;
    bool waiting_{false};
};

// Decodes body into Message::Response after checking its kind. Codec failures
// are reported as TransportError(decode).
template <class Message>
typename Message::Response decodeResponse(const ResponseBody& body) {
    if (body.kind != Message::kResponseKind) {
        throw TransportError(TransportError::Type::decode,
                             std::string{"Unexpected response kind "} + std::to_string(body.kind) + " for " +
                                 Message::kName);
    }
    try {
        return Message::decode(body);
    } catch (const TransportError&) {
        throw;
    } catch (const std::exception& ex) {
        throw TransportError(TransportError::Type::decode,
                             std::string{"Failed to decode "} + Message::kName + " response: " + ex.what());
    }
}

// Waits for the reply in slot and hands the decoded Message::Response to
// handler, or a TransportError (timeout, channel_closed, decode).
template <class Message>
void awaitResponse(boost::asio::io_context& io,
                   const std::shared_ptr<CompletionSlot>& slot,
                   std::function<void(std::exception_ptr, typename Message::Response)> handler,
                   std::chrono::steady_clock::duration deadline = kResponseTimeout) {
    slot->asyncWait(io, deadline, Message::kName,
        [handler = std::move(handler)](std::exception_ptr error, ResponseBody body) {
            if (error) {
                handler(std::move(error), typename Message::Response{});
                return;
            }
            typename Message::Response response;
            try {
                response = decodeResponse<Message>(body);
            } catch (const TransportError&) {
                handler(std::current_exception(), typename Message::Response{});
                return;
            }
            handler(nullptr, std::move(response));
        });
}

// Job id to pending slot map. Create it with std::make_shared so resolved
// slots can remove themselves.
class ResponseCorrelator : public std::enable_shared_from_this<ResponseCorrelator> {
public:
    ResponseCorrelator() = default;
    ~ResponseCorrelator();

    ResponseCorrelator(const ResponseCorrelator&) = delete;
    ResponseCorrelator& operator=(const ResponseCorrelator&) = delete;

    // Throws std::invalid_argument when jobId is still pending.
    std::shared_ptr<CompletionSlot> registerRequest(JobId jobId);

    // Returns false when no live slot accepted the body.
    bool deliver(JobId jobId, ResponseBody body);

    // Fails every pending slot with TransportError(channel_closed).
    std::size_t failAll(const std::string& reason);

    [[nodiscard]] std::size_t pending() const;

private:
    void release(JobId jobId, const CompletionSlot* slot);

    mutable std::mutex mutex_;
    std::unordered_map<JobId, std::shared_ptr<CompletionSlot>> slots_;
};

// Reads frames until the connection fails, routing each reply to the
// correlator. The decoder returns nothing for unsolicited frames.
class ReadLoop : public std::enable_shared_from_this<ReadLoop> {
public:
    using FrameDecoder = std::function<std::optional<std::pair<JobId, ResponseBody>>(const std::string&)>;

    ReadLoop(CmReadHalf reader, std::shared_ptr<ResponseCorrelator> correlator, FrameDecoder decoder);

    void start();

    // Drops the read half, which closes the connection.
    void stop();

private:
    void readNext();
    void onFrame(const boost::system::error_code& ec, const std::string& frame);

    std::mutex mutex_;
    CmReadHalf reader_;
    std::shared_ptr<ResponseCorrelator> correlator_;
    FrameDecoder decoder_;
    std::atomic<bool> stopped_{false};
};

} // namespace cmlink::transport
