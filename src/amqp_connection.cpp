// ============================================================================
// amqp_connection.cpp: implementation for amqp_connection.hpp
// ============================================================================

#include "amqp_connection.hpp"

#include <sys/time.h>
#include <vector>

#include <rabbitmq-c/ssl_socket.h>
#include <rabbitmq-c/tcp_socket.h>
#include <spdlog/spdlog.h>

namespace endec {

// ---------------------------------------------------------------------------
// describe()
// Human-readable text for an RPC reply; empty when the reply is normal.
// ---------------------------------------------------------------------------
static std::string describe(const amqp_rpc_reply_t& r) {
    switch (r.reply_type) {
        case AMQP_RESPONSE_NORMAL:
            return {};
        case AMQP_RESPONSE_NONE:
            return "missing RPC reply";
        case AMQP_RESPONSE_LIBRARY_EXCEPTION:
            return amqp_error_string2(r.library_error);
        case AMQP_RESPONSE_SERVER_EXCEPTION:
            if (r.reply.id == AMQP_CONNECTION_CLOSE_METHOD) {
                auto* m = static_cast<amqp_connection_close_t*>(r.reply.decoded);
                return "connection closed: " + std::to_string(m->reply_code) + " " +
                       std::string(static_cast<const char*>(m->reply_text.bytes), m->reply_text.len);
            }
            if (r.reply.id == AMQP_CHANNEL_CLOSE_METHOD) {
                auto* m = static_cast<amqp_channel_close_t*>(r.reply.decoded);
                return "channel closed: " + std::to_string(m->reply_code) + " " +
                       std::string(static_cast<const char*>(m->reply_text.bytes), m->reply_text.len);
            }
            return "server exception, method " + std::to_string(r.reply.id);
    }
    return "unknown reply";
}

static bool check(amqp_connection_state_t c, const char* what, std::string& err) {
    const std::string d = describe(amqp_get_rpc_reply(c));
    if (d.empty()) return true;
    err = std::string(what) + ": " + d;
    return false;
}

AmqpConnection::AmqpConnection(std::string url) : url_(std::move(url)) {}

AmqpConnection::~AmqpConnection() {
    close();
}

bool AmqpConnection::open(std::string& err) {
    close();

    // amqp_parse_url() points into the buffer it is given.
    std::vector<char> buf(url_.begin(), url_.end());
    buf.push_back('\0');
    amqp_connection_info info;
    amqp_default_connection_info(&info);
    if (amqp_parse_url(buf.data(), &info) != AMQP_STATUS_OK) {
        err = "malformed broker URL";
        return false;
    }

    conn_ = amqp_new_connection();
    if (!conn_) {
        err = "amqp_new_connection failed";
        return false;
    }

    timeval rpc_tv{static_cast<time_t>(RPC_TIMEOUT.count()), 0};
    if (amqp_set_handshake_timeout(conn_, &rpc_tv) != AMQP_STATUS_OK ||
        amqp_set_rpc_timeout(conn_, &rpc_tv) != AMQP_STATUS_OK) {
        err = "cannot set broker timeouts";
        drop();
        return false;
    }

    amqp_socket_t* sock = nullptr;
    if (info.ssl) {
        sock = amqp_ssl_socket_new(conn_);
        if (sock) {
            amqp_ssl_socket_set_verify_peer(sock, 1);
            amqp_ssl_socket_set_verify_hostname(sock, 1);
        }
    } else {
        sock = amqp_tcp_socket_new(conn_);
    }
    if (!sock) {
        err = "cannot create socket";
        drop();
        return false;
    }

    timeval tv{static_cast<time_t>(CONNECT_TIMEOUT.count()), 0};
    int rc = amqp_socket_open_noblock(sock, info.host, info.port, &tv);
    if (rc != AMQP_STATUS_OK) {
        err = std::string("connect ") + info.host + ":" + std::to_string(info.port) + ": " +
              amqp_error_string2(rc);
        drop();
        return false;
    }

    const amqp_rpc_reply_t login = amqp_login(conn_, info.vhost, 0, FRAME_MAX, 0,
                                              AMQP_SASL_METHOD_PLAIN, info.user, info.password);
    if (login.reply_type != AMQP_RESPONSE_NORMAL) {
        err = "login: " + describe(login);
        drop();
        return false;
    }

    amqp_channel_open(conn_, CHANNEL);
    if (!check(conn_, "channel.open", err)) {
        drop();
        return false;
    }
    channel_open_ = true;

    amqp_confirm_select(conn_, CHANNEL);
    if (!check(conn_, "confirm.select", err)) {
        close();
        return false;
    }
    return true;
}

bool AmqpConnection::declare_exchange(const std::string& exchange, std::string& err) {
    if (!conn_) {
        err = "not connected";
        return false;
    }
    amqp_exchange_declare(conn_, CHANNEL,
                          amqp_cstring_bytes(exchange.c_str()),
                          amqp_cstring_bytes("topic"),
                          0 /*passive*/, 1 /*durable*/, 0 /*auto_delete*/, 0 /*internal*/,
                          amqp_empty_table);
    return check(conn_, "exchange.declare", err);
}

PublishOutcome AmqpConnection::publish(const std::string& exchange,
                                       const std::string& routing_key,
                                       const std::string& body) {
    if (!conn_) return PublishOutcome::ConnectionLost;

    amqp_basic_properties_t props{};
    props._flags = AMQP_BASIC_CONTENT_TYPE_FLAG | AMQP_BASIC_DELIVERY_MODE_FLAG;
    props.content_type = amqp_cstring_bytes("application/json");
    props.delivery_mode = AMQP_DELIVERY_PERSISTENT;

    amqp_bytes_t payload;
    payload.len = body.size();
    payload.bytes = const_cast<char*>(body.data());

    const int rc = amqp_basic_publish(conn_, CHANNEL,
                                      amqp_cstring_bytes(exchange.c_str()),
                                      amqp_cstring_bytes(routing_key.c_str()),
                                      1 /*mandatory*/, 0 /*immediate*/, &props, payload);
    if (rc != AMQP_STATUS_OK) {
        spdlog::debug("[amqp] basic.publish: {}", amqp_error_string2(rc));
        drop();
        return PublishOutcome::ConnectionLost;
    }
    return wait_confirm();
}

// ---------------------------------------------------------------------------
// wait_confirm()
// Read frames until the confirm for the message just sent. A basic.return
// (mandatory, no queue bound) arrives before its ack and is remembered.
// ---------------------------------------------------------------------------
PublishOutcome AmqpConnection::wait_confirm() {
    bool returned = false;

    for (;;) {
        amqp_maybe_release_buffers(conn_);

        amqp_frame_t frame;
        timeval tv{static_cast<time_t>(CONFIRM_TIMEOUT.count()), 0};
        const int rc = amqp_simple_wait_frame_noblock(conn_, &frame, &tv);
        if (rc != AMQP_STATUS_OK) {
            spdlog::debug("[amqp] waiting for confirm: {}", amqp_error_string2(rc));
            drop();
            return PublishOutcome::ConnectionLost;
        }
        if (frame.frame_type != AMQP_FRAME_METHOD) continue;

        switch (frame.payload.method.id) {
            case AMQP_BASIC_ACK_METHOD:
                return returned ? PublishOutcome::Unroutable : PublishOutcome::Delivered;

            case AMQP_BASIC_NACK_METHOD:
                return PublishOutcome::Nacked;

            case AMQP_BASIC_RETURN_METHOD: {
                returned = true;
                amqp_message_t msg;
                const amqp_rpc_reply_t r = amqp_read_message(conn_, frame.channel, &msg, 0);
                if (r.reply_type != AMQP_RESPONSE_NORMAL) {
                    drop();
                    return PublishOutcome::ConnectionLost;
                }
                amqp_destroy_message(&msg);
                break;
            }

            case AMQP_CHANNEL_CLOSE_METHOD:
            case AMQP_CONNECTION_CLOSE_METHOD:
                spdlog::debug("[amqp] broker closed the {}",
                              frame.payload.method.id == AMQP_CHANNEL_CLOSE_METHOD ? "channel" : "connection");
                drop();
                return PublishOutcome::ConnectionLost;

            default:
                break;
        }
    }
}

// Free the handle without a close handshake (socket already unusable).
void AmqpConnection::drop() noexcept {
    if (!conn_) return;
    amqp_destroy_connection(conn_);
    conn_ = nullptr;
    channel_open_ = false;
}

void AmqpConnection::close() noexcept {
    if (!conn_) return;
    if (channel_open_) {
        const amqp_rpc_reply_t r = amqp_channel_close(conn_, CHANNEL, AMQP_REPLY_SUCCESS);
        if (r.reply_type != AMQP_RESPONSE_NORMAL) spdlog::debug("[amqp] channel.close: {}", describe(r));
    }
    const amqp_rpc_reply_t r = amqp_connection_close(conn_, AMQP_REPLY_SUCCESS);
    if (r.reply_type != AMQP_RESPONSE_NORMAL) spdlog::debug("[amqp] connection.close: {}", describe(r));
    drop();
}

} // namespace endec
