#ifndef LANSHARE_CONNECTION_HPP
#define LANSHARE_CONNECTION_HPP

#include <asio.hpp>
#include <cstring>
#include <deque>
#include <memory>
#include <functional>

#include "protocol.hpp"
#include "../common/logger.hpp"

// Define a message structure for easier handling
struct Message {
    MessageType type;
    std::vector<uint8_t> payload;
};

/**
 * @brief One framed TCP stream: [len u32][type u8][payload].
 *
 * Reads and writes run on the connection's own strand. Frames are delivered
 * to the message handler in arrival order; writes are queued and sent one
 * at a time. Reading pauses while MAX_PENDING_WRITES frames wait to be sent,
 * so a peer that stops reading cannot grow the queue.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;
    using message_handler = std::function<void(Message)>;
    using close_handler = std::function<void(const asio::error_code&)>;

    static constexpr size_t MAX_PENDING_WRITES = 8;

    explicit Connection(asio::io_context& io_context)
        : strand_(asio::make_strand(io_context)), socket_(strand_) {}

    void set_message_handler(message_handler handler) {
        message_handler_ = std::move(handler);
    }

    void set_close_handler(close_handler handler) {
        close_handler_ = std::move(handler);
    }

    asio::ip::tcp::socket& socket() {
        return socket_;
    }

    Strand& strand() {
        return strand_;
    }

    // Begin reading frames. Call once the socket is connected.
    void start() {
        asio::post(strand_, [self = shared_from_this()]() {
            self->read_header();
        });
    }

    // Runs inline when called from the connection's strand.
    void send_message(Message msg) {
        asio::dispatch(strand_, [self = shared_from_this(), msg = std::move(msg)]() mutable {
            if (self->closed_) {
                return;
            }
            bool write_in_progress = !self->write_msgs_.empty();
            self->write_msgs_.push_back(std::move(msg));
            if (!write_in_progress) {
                self->write_header();
            }
        });
    }

    void close() {
        asio::post(strand_, [self = shared_from_this()]() {
            self->fail(asio::error::operation_aborted);
        });
    }

    // Frames queued but not fully written. Call on the strand.
    size_t pending_writes() const {
        return write_msgs_.size();
    }

    std::string remote_address() const {
        asio::error_code ec;
        auto endpoint = socket_.remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

private:
    void read_header() {
        asio::async_read(socket_, asio::buffer(read_header_buffer_, HEADER_SIZE),
            [self = shared_from_this()](const asio::error_code& error, size_t /*bytes_transferred*/) {
                if (error) {
                    self->fail(error);
                    return;
                }
                uint32_t payload_len;
                std::memcpy(&payload_len, self->read_header_buffer_.data(), sizeof(uint32_t));
                payload_len = asio::detail::socket_ops::network_to_host_long(payload_len);

                if (payload_len > MAX_FRAME_SIZE) {
                    LOG_WARN("Frame of ", payload_len, " bytes from ", self->remote_address(), " exceeds limit, closing");
                    self->fail(asio::error::message_size);
                    return;
                }

                MessageType msg_type = static_cast<MessageType>(self->read_header_buffer_[sizeof(uint32_t)]);
                self->read_body(payload_len, msg_type);
            });
    }

    void read_body(uint32_t payload_len, MessageType msg_type) {
        read_msg_.type = msg_type;
        read_msg_.payload.resize(payload_len);

        asio::async_read(socket_, asio::buffer(read_msg_.payload),
            [self = shared_from_this()](const asio::error_code& error, size_t /*bytes_transferred*/) {
                if (error) {
                    self->fail(error);
                    return;
                }
                if (self->message_handler_) {
                    self->message_handler_(std::move(self->read_msg_));
                }
                self->read_msg_ = Message{};
                if (self->closed_) {
                    return;
                }
                if (self->write_msgs_.size() >= MAX_PENDING_WRITES) {
                    self->read_paused_ = true;
                    return;
                }
                self->read_header();
            });
    }

    void write_header() {
        if (write_msgs_.empty()) {
            return;
        }
        const Message& msg = write_msgs_.front();
        uint32_t payload_len = static_cast<uint32_t>(msg.payload.size());
        payload_len = asio::detail::socket_ops::host_to_network_long(payload_len);

        std::memcpy(write_header_buffer_.data(), &payload_len, sizeof(uint32_t));
        write_header_buffer_[sizeof(uint32_t)] = static_cast<uint8_t>(msg.type);

        std::array<asio::const_buffer, 2> buffers = {
            asio::buffer(write_header_buffer_, HEADER_SIZE),
            asio::buffer(msg.payload)
        };
        asio::async_write(socket_, buffers,
            [self = shared_from_this()](const asio::error_code& error, size_t /*bytes_transferred*/) {
                if (error) {
                    self->fail(error);
                    return;
                }
                self->write_msgs_.pop_front();
                if (!self->write_msgs_.empty()) {
                    self->write_header();
                }
                if (self->read_paused_ && self->write_msgs_.size() < MAX_PENDING_WRITES) {
                    self->read_paused_ = false;
                    self->read_header();
                }
            });
    }

    void fail(const asio::error_code& error) {
        if (closed_) {
            return;
        }
        closed_ = true;
        asio::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        write_msgs_.clear();
        // Handlers may hold the last reference to this connection.
        auto on_close = std::move(close_handler_);
        message_handler_ = nullptr;
        if (on_close) {
            on_close(error);
        }
    }

    Strand strand_;
    asio::ip::tcp::socket socket_;
    std::array<uint8_t, HEADER_SIZE> read_header_buffer_;
    std::array<uint8_t, HEADER_SIZE> write_header_buffer_;
    Message read_msg_;
    std::deque<Message> write_msgs_;
    message_handler message_handler_;
    close_handler close_handler_;
    bool closed_ = false;
    bool read_paused_ = false;
};

#endif //LANSHARE_CONNECTION_HPP
