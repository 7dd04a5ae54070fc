#include "business/mail/email_tools.h"
#include "business/request_handler.h"
#include "fake_mailer.h"
#include "protocol/mcp_version.h"
#include "test_util.h"
#include "transport/http_handler.h"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <chrono>
#include <gtest/gtest.h>
#include <system_error>

using namespace mcpmail;
using namespace mcpmail::transport;
using mcpmail::testing::run_sync;
using json = nlohmann::json;

namespace {
    // Connection double that captures everything written to it
    class RecordingConnection : public Connection {
    public:
        explicit RecordingConnection(asio::any_io_executor executor)
            : executor_(executor), peer_watch_(executor) {
            connection_id_ = "test-connection";
        }

        asio::awaitable<void> start(HttpHandler *) override { co_return; }

        asio::awaitable<void> write(const std::string &message) override {
            if (closed_) {
                throw std::system_error(asio::error::not_connected);
            }
            output += message;
            co_return;
        }

        asio::awaitable<void> wait_for_disconnect() override {
            if (!hung_up_ && !closed_) {
                peer_watch_.expires_at(asio::steady_timer::time_point::max());
                std::error_code ec;
                co_await peer_watch_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            }
        }

        void close() override {
            closed_ = true;
            peer_watch_.cancel();
        }
        bool is_closed() const override { return closed_; }
        asio::any_io_executor get_executor() override { return executor_; }

        // The client side goes away without a word
        void hang_up() {
            hung_up_ = true;
            peer_watch_.cancel();
        }

        std::string output;

    private:
        asio::any_io_executor executor_;
        asio::steady_timer peer_watch_;
        bool hung_up_ = false;
    };

    std::string raw(const std::string &method, const std::string &target, const std::string &body = "",
                    const std::vector<std::string> &headers = {}) {
        std::string out = method + " " + target + " HTTP/1.1\r\nHost: localhost\r\n";
        for (const auto &h: headers) {
            out += h + "\r\n";
        }
        if (!body.empty()) {
            out += "Content-Type: application/json\r\nContent-Length: " + std::to_string(body.size()) + "\r\n";
        }
        return out + "\r\n" + body;
    }
}// namespace

class HttpHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto registry = std::make_shared<business::ToolRegistry>();
        tools = std::make_shared<business::mail::EmailTools>(std::make_shared<mcpmail::testing::FakeMailer>());
        tools->register_all(*registry);
        store = std::make_shared<session::SessionStore>();
        transport = std::make_shared<StreamableTransport>(
                std::make_shared<business::RequestHandler>(registry), store, TransportOptions{});
        handler = std::make_shared<HttpHandler>(transport, 4096);
        connection = std::make_shared<RecordingConnection>(io.get_executor());
    }

    std::string serve(const std::string &request) {
        connection->output.clear();
        asio::co_spawn(io, handler->handle_request(connection, request), asio::detached);
        io.restart();
        io.run();
        return connection->output;
    }

    HttpReply route(const std::string &request) {
        auto req = HttpHandler::parse_request(request);
        EXPECT_TRUE(req.has_value());
        return run_sync(handler->route(req.value()));
    }

    std::string initialize() {
        auto reply = route(raw("POST", "/mcp", R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"));
        return reply.header(protocol::header::SESSION_ID).value_or("");
    }

    asio::io_context io;
    std::shared_ptr<business::mail::EmailTools> tools;
    std::shared_ptr<session::SessionStore> store;
    std::shared_ptr<StreamableTransport> transport;
    std::shared_ptr<HttpHandler> handler;
    std::shared_ptr<RecordingConnection> connection;
};

TEST(HttpParseTest, ParsesRequestLineHeadersAndBody) {
    auto req = HttpHandler::parse_request("POST /mcp?x=1 HTTP/1.1\r\nmcp-session-id: abc\r\nContent-Length: 2\r\n\r\n{}");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->method, "POST");
    EXPECT_EQ(req->target, "/mcp?x=1");
    EXPECT_EQ(req->path(), "/mcp");
    EXPECT_EQ(req->version, "HTTP/1.1");
    EXPECT_EQ(req->header("Mcp-Session-Id").value_or(""), "abc");
    EXPECT_EQ(req->body, "{}");
}

TEST(HttpParseTest, RejectsMalformedRequests) {
    EXPECT_FALSE(HttpHandler::parse_request("GET /mcp HTTP/1.1\r\n").has_value());
    EXPECT_FALSE(HttpHandler::parse_request("GARBAGE\r\n\r\n").has_value());
    EXPECT_FALSE(HttpHandler::parse_request("GET /mcp FTP/1.0\r\n\r\n").has_value());
}

TEST(HttpParseTest, ContentLength) {
    size_t length = 99;
    EXPECT_TRUE(HttpHandler::read_content_length("POST / HTTP/1.1\r\ncontent-length: 12\r\n", length));
    EXPECT_EQ(length, 12u);
    EXPECT_TRUE(HttpHandler::read_content_length("GET / HTTP/1.1\r\nHost: x\r\n", length));
    EXPECT_EQ(length, 0u);
    EXPECT_FALSE(HttpHandler::read_content_length("POST / HTTP/1.1\r\nContent-Length: -4\r\n", length));
    EXPECT_FALSE(HttpHandler::read_content_length("POST / HTTP/1.1\r\nContent-Length: 1e3\r\n", length));
}

TEST(HttpSerializeTest, AcceptedHasNoBody) {
    auto text = HttpHandler::serialize(HttpReply::accepted(), true);
    EXPECT_EQ(text.rfind("HTTP/1.1 202 Accepted\r\n", 0), 0u);
    EXPECT_NE(text.find("Content-Length: 0\r\n"), std::string::npos);
    EXPECT_EQ(text.find("Content-Type"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 4), "\r\n\r\n");
}

TEST(HttpSerializeTest, JsonReplyCarriesHeaders) {
    auto reply = HttpReply::error(409, "busy");
    reply.headers.emplace_back("Mcp-Session-Id", "s1");
    auto text = HttpHandler::serialize(reply, false);
    EXPECT_EQ(text.rfind("HTTP/1.1 409 Conflict\r\n", 0), 0u);
    EXPECT_NE(text.find("Mcp-Session-Id: s1\r\n"), std::string::npos);
    EXPECT_NE(text.find("Connection: close\r\n"), std::string::npos);
    EXPECT_NE(text.find(R"({"error":"busy"})"), std::string::npos);
    EXPECT_STREQ(HttpHandler::status_text(410), "Gone");
    EXPECT_STREQ(HttpHandler::status_text(413), "Payload Too Large");
}

TEST_F(HttpHandlerTest, RouteTable) {
    EXPECT_EQ(route(raw("GET", "/health")).status, 200);
    EXPECT_EQ(route(raw("GET", "/sse")).content_type, "text/event-stream");
    EXPECT_EQ(route(raw("GET", "/nowhere")).status, 404);
    EXPECT_EQ(route(raw("PUT", "/health")).status, 404);

    auto del = route(raw("DELETE", "/mcp"));
    EXPECT_EQ(del.status, 405);
    EXPECT_EQ(del.header("Allow").value_or(""), "GET, POST");

    for (const char *path: {"/", "/rpc", "/jsonrpc"}) {
        auto reply = route(raw("POST", path, R"({"jsonrpc":"2.0","id":1,"method":"ping"})"));
        EXPECT_EQ(reply.status, 200) << path;
        EXPECT_TRUE(json::parse(reply.body)["result"].is_object()) << path;
    }
}

TEST_F(HttpHandlerTest, OversizedBodyIs413) {
    std::string big(5000, ' ');
    EXPECT_EQ(route(raw("POST", "/mcp", big)).status, 413);
}

TEST_F(HttpHandlerTest, PostInitializeOverTheWire) {
    auto out = serve(raw("POST", "/mcp", R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"));
    EXPECT_EQ(out.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(out.find("Mcp-Session-Id: "), std::string::npos);
    EXPECT_NE(out.find("Mcp-Protocol-Version: 2024-11-05\r\n"), std::string::npos);
    EXPECT_NE(out.find("mcp-sendmail-server"), std::string::npos);
    EXPECT_FALSE(connection->is_closed());
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(HttpHandlerTest, InvalidRequestClosesConnection) {
    auto out = serve("NONSENSE\r\n\r\n");
    EXPECT_EQ(out.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
    EXPECT_TRUE(connection->is_closed());
}

TEST_F(HttpHandlerTest, ConnectionCloseIsHonoured) {
    serve(raw("GET", "/health", "", {"Connection: close"}));
    EXPECT_TRUE(connection->is_closed());
}

TEST_F(HttpHandlerTest, StreamErrorsAreAnsweredAsJson) {
    auto out = serve(raw("GET", "/mcp"));
    EXPECT_EQ(out.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);

    out = serve(raw("GET", "/mcp", "", {"Mcp-Session-Id: nope"}));
    EXPECT_EQ(out.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
}

TEST_F(HttpHandlerTest, StreamIsChunkedAndEndsOnSessionClose) {
    auto sid = initialize();
    ASSERT_FALSE(sid.empty());

    connection->output.clear();
    asio::co_spawn(io, handler->handle_request(connection, raw("GET", "/mcp", "", {"Mcp-Session-Id: " + sid})),
                   asio::detached);
    asio::post(io, [&]() { store->destroy(sid); });
    io.run();

    const auto &out = connection->output;
    EXPECT_EQ(out.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(out.find("Content-Type: text/event-stream\r\n"), std::string::npos);
    EXPECT_NE(out.find("Transfer-Encoding: chunked\r\n"), std::string::npos);
    // Replayed initialize response, then the terminal event
    EXPECT_NE(out.find("id: 1\nevent: message\n"), std::string::npos);
    EXPECT_NE(out.find("event: session_closed\n"), std::string::npos);
    EXPECT_EQ(out.substr(out.size() - 5), "0\r\n\r\n");
    EXPECT_TRUE(connection->is_closed());
}

TEST_F(HttpHandlerTest, DroppedStreamClientReleasesSessionImmediately) {
    auto sid = initialize();
    ASSERT_FALSE(sid.empty());
    const auto stream_request = raw("GET", "/mcp", "", {"Mcp-Session-Id: " + sid, "Last-Event-Id: 0"});

    auto started = std::chrono::steady_clock::now();
    asio::co_spawn(io, handler->handle_request(connection, stream_request), asio::detached);
    asio::post(io, [&]() { connection->hang_up(); });
    io.run();

    // Released well before the first keep-alive would have noticed
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_TRUE(connection->is_closed());
    EXPECT_EQ(connection->output.find("event: session_closed"), std::string::npos);
    auto session = store->find(sid);
    ASSERT_NE(session, nullptr);
    EXPECT_FALSE(session->closed());
    EXPECT_FALSE(session->attached());

    // The reconnecting client gets the stream back instead of 409
    auto reconnected = std::make_shared<RecordingConnection>(io.get_executor());
    asio::co_spawn(io, handler->handle_request(reconnected, stream_request), asio::detached);
    asio::post(io, [&]() { store->destroy(sid); });
    io.restart();
    io.run();

    EXPECT_EQ(reconnected->output.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(reconnected->output.find("id: 1\nevent: message\n"), std::string::npos);
    EXPECT_NE(reconnected->output.find("event: session_closed\n"), std::string::npos);
}
