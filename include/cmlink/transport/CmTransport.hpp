#pragma once

#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace cmlink::transport {

using WebSocketStream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

// One established CM connection. Every operation runs on the stream's strand;
// reads and queued writes may be in flight at the same time.
class CmConnection : public std::enable_shared_from_this<CmConnection> {
public:
    using ReadHandler = std::function<void(boost::system::error_code, std::string)>;
    using WriteHandler = std::function<void(boost::system::error_code)>;

    CmConnection(std::unique_ptr<WebSocketStream> stream, std::string endpoint);

    void asyncRead(ReadHandler handler);
    void send(std::string payload, WriteHandler handler);

    // Idempotent. Pending and later operations complete with not_connected.
    void close();

    [[nodiscard]] bool isOpen() const noexcept { return open_.load(); }
    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }

private:
    void doWrite();
    void onWrite(const boost::system::error_code& ec);

    std::unique_ptr<WebSocketStream> stream_;
    std::string endpoint_;
    boost::beast::flat_buffer readBuffer_;
    std::deque<std::pair<std::string, WriteHandler>> outbox_;
    std::atomic<bool> open_{true};
    bool closing_{false};
};

class CmReadHalf {
public:
    CmReadHalf() = default;
    explicit CmReadHalf(std::shared_ptr<CmConnection> connection);
    CmReadHalf(CmReadHalf&& other) noexcept = default;
    CmReadHalf& operator=(CmReadHalf&& other) noexcept;
    CmReadHalf(const CmReadHalf&) = delete;
    CmReadHalf& operator=(const CmReadHalf&) = delete;
    ~CmReadHalf();

    // Completes with the next binary or text frame.
    void asyncRead(CmConnection::ReadHandler handler);

    [[nodiscard]] bool valid() const noexcept { return connection_ != nullptr; }

private:
    std::shared_ptr<CmConnection> connection_;
};

class CmWriteHalf {
public:
    CmWriteHalf() = default;
    explicit CmWriteHalf(std::shared_ptr<CmConnection> connection);
    CmWriteHalf(CmWriteHalf&& other) noexcept = default;
    CmWriteHalf& operator=(CmWriteHalf&& other) noexcept;
    CmWriteHalf(const CmWriteHalf&) = delete;
    CmWriteHalf& operator=(const CmWriteHalf&) = delete;
    ~CmWriteHalf();

    // Frames are written in call order.
    void send(std::string payload, CmConnection::WriteHandler handler = {});

    [[nodiscard]] bool valid() const noexcept { return connection_ != nullptr; }

private:
    std::shared_ptr<CmConnection> connection_;
};

// Transport handle returned by a successful connect. Dropping either half
// closes the connection for both.
class CmTransport {
public:
    CmTransport() = default;
    CmTransport(CmReadHalf reader, CmWriteHalf writer, std::string endpoint);

    [[nodiscard]] CmReadHalf& reader() noexcept { return reader_; }
    [[nodiscard]] CmWriteHalf& writer() noexcept { return writer_; }
    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] bool valid() const noexcept { return reader_.valid() && writer_.valid(); }

    std::pair<CmReadHalf, CmWriteHalf> split() &&;

private:
    CmReadHalf reader_;
    CmWriteHalf writer_;
    std::string endpoint_;
};

} // namespace cmlink::transport
