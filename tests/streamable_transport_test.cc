#include "business/mail/email_tools.h"
#include "business/request_handler.h"
#include "fake_mailer.h"
#include "protocol/mcp_version.h"
#include "test_util.h"
#include "transport/streamable_transport.h"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <cstdint>
#include <gtest/gtest.h>
#include <version.h>

using namespace mcpmail;
using namespace mcpmail::transport;
using namespace std::chrono_literals;
using mcpmail::testing::run_sync;
using json = nlohmann::json;

namespace {
    // Records SSE output; reports the client gone once `accept` writes were taken
    class CapturingWriter : public StreamWriter {
    public:
        explicit CapturingWriter(size_t accept = SIZE_MAX) : accept_(accept) {}

        asio::awaitable<bool> write(const std::string &data) override {
            if (writes.size() >= accept_) {
                co_return false;
            }
            writes.push_back(data);
            co_return true;
        }

        std::vector<std::string> writes;

    private:
        size_t accept_;
    };
}// namespace

class StreamableTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        mailer = std::make_shared<mcpmail::testing::FakeMailer>();
        auto registry = std::make_shared<business::ToolRegistry>();
        tools = std::make_shared<business::mail::EmailTools>(mailer);
        tools->register_all(*registry);
        auto handler = std::make_shared<business::RequestHandler>(registry);

        session::SessionStoreOptions options;
        options.idle_timeout = 60s;
        options.retention.max_events = 3;
        store = std::make_shared<session::SessionStore>(options);

        TransportOptions transport_options;
        transport_options.keepalive_interval = 1s;
        transport_options.smtp_host = "smtp.test";
        transport_options.smtp_port = 587;
        transport = std::make_shared<StreamableTransport>(handler, store, transport_options);
    }

    HttpReply post(const std::string &body, const std::optional<std::string> &session_id = std::nullopt) {
        HttpRequest req;
        req.method = "POST";
        req.target = "/mcp";
        req.version = "HTTP/1.1";
        if (session_id) {
            req.headers[protocol::header::SESSION_ID] = *session_id;
        }
        req.body = body;
        return run_sync(transport->handle_post(req));
    }

    HttpReply rpc(const std::string &method, json params, int id, const std::optional<std::string> &session_id) {
        json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
        return post(msg.dump(), session_id);
    }

    std::string initialize() {
        auto reply = rpc("initialize", {{"protocolVersion", "2024-11-05"}}, 1, std::nullopt);
        EXPECT_EQ(reply.status, 200);
        auto id = reply.header(protocol::header::SESSION_ID);
        EXPECT_TRUE(id.has_value());
        return id.value_or("");
    }

    HttpRequest stream_request(const std::string &session_id, const std::optional<std::string> &last_event_id = std::nullopt) {
        HttpRequest req;
        req.method = "GET";
        req.target = "/mcp";
        req.headers[protocol::header::SESSION_ID] = session_id;
        if (last_event_id) {
            req.headers[protocol::header::LAST_EVENT_ID] = *last_event_id;
        }
        return req;
    }

    static json tool_payload(const json &body) {
        return json::parse(body["result"]["content"][0]["text"].get<std::string>());
    }

    asio::io_context io;
    std::shared_ptr<mcpmail::testing::FakeMailer> mailer;
    std::shared_ptr<business::mail::EmailTools> tools;
    std::shared_ptr<session::SessionStore> store;
    std::shared_ptr<StreamableTransport> transport;
};

TEST_F(StreamableTransportTest, InitializeCreatesSessionAndSetsHeaders) {
    auto reply = rpc("initialize", {{"protocolVersion", "2025-03-26"}}, 1, std::nullopt);
    EXPECT_EQ(reply.status, 200);
    ASSERT_TRUE(reply.header(protocol::header::SESSION_ID).has_value());
    EXPECT_EQ(reply.header(protocol::header::PROTOCOL_VERSION).value_or(""), "2025-03-26");

    auto body = json::parse(reply.body);
    EXPECT_EQ(body["id"], 1);
    EXPECT_EQ(body["result"]["serverInfo"]["name"], MCPMAIL_SERVER_NAME);

    auto session = store->find(*reply.header(protocol::header::SESSION_ID));
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->newest_event_id(), 1u);
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(StreamableTransportTest, ToolsListReturnsMailToolsInOrder) {
    auto sid = initialize();
    auto reply = rpc("tools/list", json::object(), 2, sid);
    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.header(protocol::header::SESSION_ID).value_or(""), sid);

    auto tools_json = json::parse(reply.body)["result"]["tools"];
    ASSERT_EQ(tools_json.size(), 4u);
    EXPECT_EQ(tools_json[0]["name"], "send_email");
    EXPECT_EQ(tools_json[1]["name"], "send_bulk_email");
    EXPECT_EQ(tools_json[2]["name"], "send_template_email");
    EXPECT_EQ(tools_json[3]["name"], "verify_connection");
}

TEST_F(StreamableTransportTest, SendEmailThroughToolsCall) {
    auto sid = initialize();
    auto reply = rpc("tools/call",
                     {{"name", "send_email"},
                      {"arguments", {{"to", "a@example.com"}, {"subject", "Hi"}, {"body", "Hello"}}}},
                     3, sid);
    ASSERT_EQ(reply.status, 200);
    auto body = json::parse(reply.body);
    EXPECT_EQ(body["result"]["isError"], false);

    auto payload = tool_payload(body);
    EXPECT_EQ(payload["success"], true);
    EXPECT_EQ(payload["message"], "Email sent successfully to a@example.com");
    ASSERT_EQ(mailer->sent.size(), 1u);
    EXPECT_EQ(mailer->sent[0].to, "a@example.com");
    EXPECT_EQ(mailer->sent[0].from, "robot@example.com");
}

TEST_F(StreamableTransportTest, UnknownToolIsReportedInResult) {
    auto sid = initialize();
    auto body = json::parse(rpc("tools/call", {{"name", "nonexistent_tool"}, {"arguments", json::object()}}, 4, sid).body);
    EXPECT_EQ(body["result"]["isError"], true);
    EXPECT_EQ(tool_payload(body)["error"], "Tool not found: nonexistent_tool");
}

TEST_F(StreamableTransportTest, UnknownSessionIs404) {
    auto reply = rpc("tools/list", json::object(), 2, std::string("deadbeef"));
    EXPECT_EQ(reply.status, 404);
    EXPECT_EQ(json::parse(reply.body)["error"], "Session not found");

    // Checked before the body is even parsed
    EXPECT_EQ(post("not json", std::string("deadbeef")).status, 404);
}

TEST_F(StreamableTransportTest, MissingSessionForOtherMethodsIs400) {
    EXPECT_EQ(rpc("tools/list", json::object(), 2, std::nullopt).status, 400);
    EXPECT_EQ(post(R"({"jsonrpc":"2.0","method":"initialize"})").status, 400);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(StreamableTransportTest, MalformedBodiesAre400WithEnvelope) {
    auto parse = post("{not json");
    EXPECT_EQ(parse.status, 400);
    auto parse_body = json::parse(parse.body);
    EXPECT_EQ(parse_body["error"]["code"], -32700);
    EXPECT_TRUE(parse_body["id"].is_null());

    auto sid = initialize();
    auto invalid = post(R"({"jsonrpc":"2.0","id":5,"method":"ping","params":"x"})", sid);
    EXPECT_EQ(invalid.status, 400);
    EXPECT_EQ(json::parse(invalid.body)["error"]["code"], -32600);
}

TEST_F(StreamableTransportTest, NotificationIsAccepted) {
    auto sid = initialize();
    auto reply = post(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", sid);
    EXPECT_EQ(reply.status, 202);
    EXPECT_TRUE(reply.body.empty());
    // Nothing was appended
    EXPECT_EQ(store->get(sid)->newest_event_id(), 1u);
}

TEST_F(StreamableTransportTest, UnsupportedProtocolHeaderIs400) {
    auto sid = initialize();
    HttpRequest req;
    req.method = "POST";
    req.target = "/mcp";
    req.headers[protocol::header::SESSION_ID] = sid;
    req.headers[protocol::header::PROTOCOL_VERSION] = "1999-01-01";
    req.body = R"({"jsonrpc":"2.0","id":2,"method":"ping"})";
    EXPECT_EQ(run_sync(transport->handle_post(req)).status, 400);
}

TEST_F(StreamableTransportTest, EvictedSessionIsGone) {
    auto sid = initialize();
    EXPECT_EQ(store->sweep(session::Clock::now() + 120s), 1u);
    EXPECT_EQ(rpc("ping", json::object(), 2, sid).status, 404);
}

TEST_F(StreamableTransportTest, PostResponsesAreAppendedToTheLog) {
    auto sid = initialize();
    auto ping = rpc("ping", json::object(), 2, sid);

    auto opened = transport->open_stream(stream_request(sid), io.get_executor());
    ASSERT_TRUE(std::holds_alternative<std::shared_ptr<session::StreamSubscription>>(opened));
    auto sub = std::get<std::shared_ptr<session::StreamSubscription>>(opened);

    auto events = sub->poll();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].payload["result"]["serverInfo"]["name"], MCPMAIL_SERVER_NAME);
    EXPECT_EQ(events[1].payload, json::parse(ping.body));
}

TEST_F(StreamableTransportTest, OpenStreamErrors) {
    auto status_of = [&](const HttpRequest &req) {
        auto opened = transport->open_stream(req, io.get_executor());
        return std::holds_alternative<HttpReply>(opened) ? std::get<HttpReply>(opened).status : 200;
    };

    HttpRequest no_header;
    no_header.method = "GET";
    no_header.target = "/mcp";
    EXPECT_EQ(status_of(no_header), 400);
    EXPECT_EQ(status_of(stream_request("unknown")), 404);

    auto sid = initialize();
    EXPECT_EQ(status_of(stream_request(sid, std::string("abc"))), 400);
    EXPECT_EQ(status_of(stream_request(sid, std::string("-1"))), 400);
    EXPECT_EQ(status_of(stream_request(sid, std::string("7"))), 400);

    // max_events = 3: five appends prune events 1 and 2
    for (int i = 0; i < 4; ++i) {
        rpc("ping", json::object(), 10 + i, sid);
    }
    EXPECT_EQ(status_of(stream_request(sid, std::string("1"))), 410);

    auto opened = transport->open_stream(stream_request(sid, std::string("2")), io.get_executor());
    ASSERT_TRUE(std::holds_alternative<std::shared_ptr<session::StreamSubscription>>(opened));
    EXPECT_EQ(status_of(stream_request(sid)), 409);
}

TEST_F(StreamableTransportTest, StreamReplaysThenEndsWhenSessionCloses) {
    auto sid = initialize();
    rpc("ping", json::object(), 2, sid);

    auto opened = transport->open_stream(stream_request(sid, std::string("1")), io.get_executor());
    auto sub = std::get<std::shared_ptr<session::StreamSubscription>>(opened);

    CapturingWriter writer;
    asio::co_spawn(io, transport->run_stream(sub, writer), asio::detached);
    asio::post(io, [&]() { store->destroy(sid); });
    io.run();

    ASSERT_EQ(writer.writes.size(), 2u);
    EXPECT_EQ(writer.writes[0].rfind("id: 2\nevent: message\ndata: ", 0), 0u);
    EXPECT_EQ(writer.writes[1], StreamableTransport::format_session_closed(sid));
    EXPECT_FALSE(sub->active());
}

TEST_F(StreamableTransportTest, StreamDeliversNewEventsLive) {
    auto sid = initialize();
    auto sub = std::get<std::shared_ptr<session::StreamSubscription>>(
            transport->open_stream(stream_request(sid, std::string("1")), io.get_executor()));

    // Client disconnects after receiving the live event
    CapturingWriter writer(1);
    asio::co_spawn(io, transport->run_stream(sub, writer), asio::detached);
    asio::post(io, [&]() { store->append(sid, json{{"jsonrpc", "2.0"}, {"method", "notifications/message"}}); });
    io.run();

    ASSERT_EQ(writer.writes.size(), 1u);
    EXPECT_NE(writer.writes[0].find("notifications/message"), std::string::npos);
    // A dead client detaches the stream but keeps the session
    auto session = store->find(sid);
    ASSERT_NE(session, nullptr);
    EXPECT_FALSE(session->attached());
}

TEST_F(StreamableTransportTest, IdleStreamSendsKeepalive) {
    auto sid = initialize();
    auto sub = std::get<std::shared_ptr<session::StreamSubscription>>(
            transport->open_stream(stream_request(sid, std::string("1")), io.get_executor()));

    // The keepalive is the first write; refusing the second ends the stream
    CapturingWriter writer(1);
    asio::co_spawn(io, transport->run_stream(sub, writer), asio::detached);
    io.run();

    ASSERT_EQ(writer.writes.size(), 1u);
    EXPECT_EQ(writer.writes[0], StreamableTransport::format_keepalive());
}

TEST_F(StreamableTransportTest, EventFormatting) {
    session::StreamEvent event;
    event.id = 42;
    event.payload = json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}};
    EXPECT_EQ(StreamableTransport::format_event(event),
              "id: 42\nevent: message\ndata: {\"id\":1,\"jsonrpc\":\"2.0\",\"result\":{}}\n\n");
    EXPECT_EQ(StreamableTransport::format_keepalive(), ": keepalive\n\n");
}

TEST_F(StreamableTransportTest, HealthReportsServiceAndSessions) {
    initialize();
    auto reply = transport->health();
    EXPECT_EQ(reply.status, 200);
    auto body = json::parse(reply.body);
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["service"], MCPMAIL_SERVER_NAME);
    EXPECT_EQ(body["version"], MCPMAIL_VERSION);
    EXPECT_EQ(body["transport"], "MCP Streamable HTTP");
    EXPECT_EQ(body["smtp_host"], "smtp.test");
    EXPECT_EQ(body["smtp_port"], 587);
    EXPECT_EQ(body["active_sessions"], 1);
}

TEST_F(StreamableTransportTest, LegacySsePointsToMcpEndpoint) {
    auto reply = transport->legacy_sse();
    EXPECT_EQ(reply.content_type, "text/event-stream");
    EXPECT_EQ(reply.body.rfind("event: message\ndata: ", 0), 0u);
    EXPECT_NE(reply.body.find("Use GET /mcp instead."), std::string::npos);
    EXPECT_EQ(reply.body.substr(reply.body.size() - 2), "\n\n");
}

TEST_F(StreamableTransportTest, StatelessPostDispatchesWithoutSession) {
    HttpRequest req;
    req.method = "POST";
    req.target = "/rpc";
    req.body = R"({"jsonrpc":"2.0","id":9,"method":"tools/list"})";
    auto reply = run_sync(transport->handle_stateless_post(req));
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(json::parse(reply.body)["result"]["tools"].size(), 4u);
    EXPECT_FALSE(reply.header(protocol::header::SESSION_ID).has_value());
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(StreamableTransportTest, StopClosesEverySession) {
    initialize();
    initialize();
    transport->start();
    transport->stop();
    EXPECT_EQ(store->size(), 0u);
    EXPECT_FALSE(store->sweeper_running());
}
