#include "streamable_transport.h"
#include "core/errors.h"
#include "core/logger.h"
#include "protocol/mcp_version.h"
#include <charconv>
#include <sstream>
#include <version.h>

namespace mcpmail::transport {

    namespace {
        std::optional<std::uint64_t> parse_event_id(const std::string &text) {
            std::uint64_t value = 0;
            const char *first = text.data();
            const char *last = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (text.empty() || ec != std::errc() || ptr != last) {
                return std::nullopt;
            }
            return value;
        }

        HttpReply envelope_reply(const protocol::Response &resp) {
            return HttpReply::json(200, protocol::to_json(resp));
        }
    }// namespace

    StreamableTransport::StreamableTransport(std::shared_ptr<business::RequestHandler> handler,
                                             std::shared_ptr<session::SessionStore> store,
                                             TransportOptions options)
        : handler_(std::move(handler)), store_(std::move(store)), options_(std::move(options)) {}

    std::optional<HttpReply> StreamableTransport::envelope_error(const std::optional<protocol::Error> &error) {
        if (!error.has_value()) {
            return std::nullopt;
        }
        MCPMAIL_DEBUG("Rejected JSON-RPC envelope: {} ({})", error->message, error->code);
        return HttpReply::json(400, protocol::to_json(error.value()));
    }

    asio::awaitable<HttpReply> StreamableTransport::handle_post(const HttpRequest &req) {
        auto session_id = req.header(protocol::header::SESSION_ID);

        std::shared_ptr<session::McpSession> session;
        if (session_id.has_value()) {
            session = store_->find(session_id.value());
            if (!session) {
                MCPMAIL_DEBUG("POST for unknown session {}", session_id.value());
                co_return HttpReply::error(404, "Session not found");
            }
        }

        auto [request, error] = protocol::parse_request(req.body);
        if (auto reply = envelope_error(error)) {
            co_return reply.value();
        }

        if (!session) {
            if (request->method != "initialize" || request->is_notification()) {
                co_return HttpReply::error(400, "Missing Mcp-Session-Id header; call initialize first");
            }
            co_return co_await initialize_session(request.value());
        }

        if (auto version = req.header(protocol::header::PROTOCOL_VERSION)) {
            if (!protocol::is_supported_version(version.value())) {
                co_return HttpReply::error(400, "Unsupported protocol version: " + version.value());
            }
        }

        session->touch();
        auto response = co_await handler_->handle(request.value());
        session->touch();

        if (!response.has_value()) {
            co_return HttpReply::accepted();
        }

        // The log is the source of truth; the POST body is the first read of the new event
        nlohmann::json payload = protocol::to_json(response.value());
        bool evicted = false;
        try {
            session->append(payload);
        } catch (const core::SessionNotFound &) {
            evicted = true;
        }
        if (evicted) {
            MCPMAIL_WARN("Session {} closed while '{}' was in flight; replying directly", session->id(),
                         request->method);
        }

        HttpReply reply = HttpReply::json(200, payload);
        reply.headers.emplace_back(protocol::header::SESSION_ID, session->id());
        reply.headers.emplace_back(protocol::header::PROTOCOL_VERSION, session->protocol_version());
        co_return reply;
    }

    asio::awaitable<HttpReply> StreamableTransport::initialize_session(const protocol::Request &req) {
        std::string requested;
        if (req.params.is_object() && req.params.contains("protocolVersion") &&
            req.params["protocolVersion"].is_string()) {
            requested = req.params["protocolVersion"].get<std::string>();
        }
        auto session = store_->create(protocol::negotiate_version(requested));

        auto response = co_await handler_->handle(req);
        if (!response.has_value() || response->is_error()) {
            store_->destroy(session->id());
            co_return response.has_value() ? envelope_reply(response.value()) : HttpReply::accepted();
        }

        nlohmann::json payload = protocol::to_json(response.value());
        session->append(payload);

        HttpReply reply = HttpReply::json(200, payload);
        reply.headers.emplace_back(protocol::header::SESSION_ID, session->id());
        reply.headers.emplace_back(protocol::header::PROTOCOL_VERSION, session->protocol_version());
        co_return reply;
    }

    asio::awaitable<HttpReply> StreamableTransport::handle_stateless_post(const HttpRequest &req) {
        auto [request, error] = protocol::parse_request(req.body);
        if (auto reply = envelope_error(error)) {
            co_return reply.value();
        }

        auto response = co_await handler_->handle(request.value());
        if (!response.has_value()) {
            co_return HttpReply::accepted();
        }
        co_return envelope_reply(response.value());
    }

    StreamableTransport::StreamOpenResult StreamableTransport::open_stream(const HttpRequest &req,
                                                                           const asio::any_io_executor &executor) {
        auto session_id = req.header(protocol::header::SESSION_ID);
        if (!session_id.has_value()) {
            return HttpReply::error(400, "Missing Mcp-Session-Id header");
        }

        std::optional<std::uint64_t> last_event_id;
        if (auto raw = req.header(protocol::header::LAST_EVENT_ID)) {
            last_event_id = parse_event_id(raw.value());
            if (!last_event_id.has_value()) {
                return HttpReply::error(400, "Invalid Last-Event-Id: " + raw.value());
            }
        }

        try {
            auto subscription = store_->attach_stream(session_id.value(), executor, last_event_id);
            subscription->session()->touch();
            return subscription;
        } catch (const core::SessionNotFound &) {
            return HttpReply::error(404, "Session not found");
        } catch (const core::SessionBusy &e) {
            return HttpReply::error(409, e.what());
        } catch (const core::HistoryLost &e) {
            return HttpReply::error(410, e.what());
        } catch (const core::InvalidEventId &e) {
            return HttpReply::error(400, e.what());
        }
    }

    asio::awaitable<void> StreamableTransport::run_stream(std::shared_ptr<session::StreamSubscription> subscription,
                                                          StreamWriter &writer) {
        const std::string session_id = subscription->session_id();
        MCPMAIL_INFO("Stream opened for session {}", session_id);

        bool client_gone = false;
        while (!client_gone) {
            std::vector<session::StreamEvent> batch;
            bool history_lost = false;
            try {
                batch = subscription->poll();
            } catch (const core::HistoryLost &e) {
                MCPMAIL_WARN("Stream for session {} fell behind retention: {}", session_id, e.what());
                history_lost = true;
            }
            if (history_lost) {
                break;
            }

            for (const auto &event: batch) {
                if (!co_await writer.write(format_event(event))) {
                    client_gone = true;
                    break;
                }
            }
            if (client_gone) {
                break;
            }
            if (!batch.empty()) {
                subscription->session()->touch();
            }

            auto result = co_await subscription->wait(options_.keepalive_interval);
            if (result == session::WaitResult::Closed) {
                if (subscription->session()->closed()) {
                    co_await writer.write(format_session_closed(session_id));
                }
                break;
            }
            if (result == session::WaitResult::Timeout) {
                client_gone = !co_await writer.write(format_keepalive());
            }
        }

        subscription->detach();
        MCPMAIL_INFO("Stream closed for session {}{}", session_id, client_gone ? " (client gone)" : "");
    }

    std::string StreamableTransport::format_event(const session::StreamEvent &event) {
        std::ostringstream oss;
        oss << "id: " << event.id << "\n";
        oss << "event: message\n";
        oss << "data: " << event.payload.dump() << "\n\n";
        return oss.str();
    }

    std::string StreamableTransport::format_keepalive() {
        return ": keepalive\n\n";
    }

    std::string StreamableTransport::format_session_closed(const std::string &session_id) {
        std::ostringstream oss;
        oss << "event: session_closed\n";
        oss << "data: " << nlohmann::json{{"sessionId", session_id}, {"reason", "session closed"}}.dump() << "\n\n";
        return oss.str();
    }

    HttpReply StreamableTransport::health() const {
        return HttpReply::json(200, nlohmann::json{
                                            {"status", "healthy"},
                                            {"service", MCPMAIL_SERVER_NAME},
                                            {"version", MCPMAIL_VERSION},
                                            {"transport", "MCP Streamable HTTP"},
                                            {"protocol_version", protocol::DEFAULT_PROTOCOL_VERSION},
                                            {"smtp_host", options_.smtp_host},
                                            {"smtp_port", options_.smtp_port},
                                            {"active_sessions", store_->size()}});
    }

    HttpReply StreamableTransport::legacy_sse() const {
        HttpReply reply;
        reply.content_type = "text/event-stream";
        nlohmann::json data{{"type", "notification"},
                            {"message", "Legacy SSE endpoint. Use GET /mcp instead."}};
        reply.body = "event: message\ndata: " + data.dump() + "\n\n";
        return reply;
    }

    void StreamableTransport::start() {
        store_->start_sweeper();
        MCPMAIL_INFO("Streamable transport started");
    }

    void StreamableTransport::stop() {
        store_->stop_sweeper();
        store_->close_all();
        MCPMAIL_INFO("Streamable transport stopped");
    }

}// namespace mcpmail::transport
