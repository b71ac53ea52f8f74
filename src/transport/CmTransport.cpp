#include "cmlink/transport/CmTransport.hpp"

#include "cmlink/util/Logging.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket/error.hpp>

#include <stdexcept>

namespace cmlink::transport {

CmConnection::CmConnection(std::unique_ptr<WebSocketStream> stream, std::string endpoint)
    : stream_(std::move(stream))
    , endpoint_(std::move(endpoint)) {}

void CmConnection::asyncRead(ReadHandler handler) {
    boost::asio::dispatch(stream_->get_executor(), [self = shared_from_this(), handler = std::move(handler)]() {
        if (!self->open_) {
            handler(boost::asio::error::not_connected, {});
            return;
        }
        self->stream_->async_read(self->readBuffer_,
            [self, handler](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    self->open_ = false;
                    handler(ec, {});
                    return;
                }
                std::string frame = boost::beast::buffers_to_string(self->readBuffer_.data());
                self->readBuffer_.consume(self->readBuffer_.size());
                handler({}, std::move(frame));
            });
    });
}

void CmConnection::send(std::string payload, WriteHandler handler) {
    boost::asio::dispatch(stream_->get_executor(),
        [self = shared_from_this(), payload = std::move(payload), handler = std::move(handler)]() mutable {
            if (!self->open_) {
                if (handler) {
                    handler(boost::asio::error::not_connected);
                }
                return;
            }
            self->outbox_.emplace_back(std::move(payload), std::move(handler));
            if (self->outbox_.size() == 1) {
                self->doWrite();
            }
        });
}

void CmConnection::doWrite() {
    if (!open_) {
        auto pending = std::move(outbox_);
        outbox_.clear();
        for (auto& [payload, handler] : pending) {
            if (handler) {
                handler(boost::asio::error::not_connected);
            }
        }
        return;
    }
    stream_->binary(true);
    stream_->async_write(boost::asio::buffer(outbox_.front().first),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
            self->onWrite(ec);
        });
}

void CmConnection::onWrite(const boost::system::error_code& ec) {
    auto handler = std::move(outbox_.front().second);
    outbox_.pop_front();
    if (ec) {
        util::log(util::LogLevel::warn, "Write to CM " + endpoint_ + " failed: " + ec.message());
        open_ = false;
    }
    if (handler) {
        handler(ec);
    }
    if (!outbox_.empty()) {
        doWrite();
    }
}

void CmConnection::close() {
    boost::asio::dispatch(stream_->get_executor(), [self = shared_from_this()]() {
        if (self->closing_) {
            return;
        }
        self->closing_ = true;
        self->open_ = false;
        if (!self->stream_->is_open()) {
            return;
        }
        self->stream_->async_close(boost::beast::websocket::close_code::normal,
            [self](const boost::system::error_code& ec) {
                if (ec && ec != boost::beast::websocket::error::closed) {
                    util::log(util::LogLevel::debug, "Closing CM " + self->endpoint_ + ": " + ec.message());
                }
            });
    });
}

CmReadHalf::CmReadHalf(std::shared_ptr<CmConnection> connection)
    : connection_(std::move(connection)) {}

CmReadHalf& CmReadHalf::operator=(CmReadHalf&& other) noexcept {
    if (this != &other) {
        if (connection_) {
            connection_->close();
        }
        connection_ = std::move(other.connection_);
    }
    return *this;
}

CmReadHalf::~CmReadHalf() {
    if (connection_) {
        connection_->close();
    }
}

void CmReadHalf::asyncRead(CmConnection::ReadHandler handler) {
    if (!connection_) {
        throw std::logic_error("read on an empty CM read half");
    }
    connection_->asyncRead(std::move(handler));
}

CmWriteHalf::CmWriteHalf(std::shared_ptr<CmConnection> connection)
    : connection_(std::move(connection)) {}

CmWriteHalf& CmWriteHalf::operator=(CmWriteHalf&& other) noexcept {
    if (this != &other) {
        if (connection_) {
            connection_->close();
        }
        connection_ = std::move(other.connection_);
    }
    return *this;
}

CmWriteHalf::~CmWriteHalf() {
    if (connection_) {
        connection_->close();
    }
}

void CmWriteHalf::send(std::string payload, CmConnection::WriteHandler handler) {
    if (!connection_) {
        throw std::logic_error("send on an empty CM write half");
    }
    connection_->send(std::move(payload), std::move(handler));
}

CmTransport::CmTransport(CmReadHalf reader, CmWriteHalf writer, std::string endpoint)
    : reader_(std::move(reader))
    , writer_(std::move(writer))
    , endpoint_(std::move(endpoint)) {}

std::pair<CmReadHalf, CmWriteHalf> CmTransport::split() && {
    return {std::move(reader_), std::move(writer_)};
}

} // namespace cmlink::transport
