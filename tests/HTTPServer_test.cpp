#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <future>
#include <thread>

#include "davbridge/http_server.hpp"
#include "SnapshotFixtures.hpp"

using ::testing::HasSubstr;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class HTTPServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto store = std::make_shared<CacheStore>(8);
        store->publish(makeSnapshot({makeCalendar(Project("p1", "Website"), {makeTask("t1", "p1", "Design", "2024-06-01")})}));

        CalDAVSettings caldav;
        caldav.username = "alice";
        caldav.password = "secret";
        handler = std::make_shared<CalDAVHandler>(store, caldav, nullptr);

        settings.host = "127.0.0.1";
        settings.port = 0;
        settings.idleTimeoutSeconds = 30;
        settings.bodyLimit = 1024;
    }

    tcp::socket connect(unsigned short port) {
        tcp::socket socket(client);
        socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
        return socket;
    }

    net::io_context client;
    std::shared_ptr<CalDAVHandler> handler;
    ServerSettings settings;
};

TEST_F(HTTPServerTest, ServesRequestsOnKeepAliveConnection) {
    HTTPServer server(settings, handler);
    server.start();
    ASSERT_NE(server.port(), 0);

    tcp::socket socket = connect(server.port());
    beast::flat_buffer buffer;
    for (int i = 0; i < 2; i++) {
        http::request<http::string_body> req{http::verb::options, "/calendars/", 11};
        req.set(http::field::host, "localhost");
        http::write(socket, req);

        http::response<http::string_body> res;
        http::read(socket, buffer, res);
        EXPECT_EQ(res.result_int(), 200u);
        EXPECT_EQ(res[http::field::server], "DAVBridge");
        auto dav = res["DAV"];
        EXPECT_THAT(std::string(dav.data(), dav.size()), HasSubstr("calendar-access"));
        EXPECT_TRUE(res.keep_alive());
    }
    server.stop();
}

TEST_F(HTTPServerTest, OversizedBodyIsRejected) {
    HTTPServer server(settings, handler);
    server.start();

    tcp::socket socket = connect(server.port());
    http::request<http::string_body> req{http::verb::propfind, "/calendars/", 11};
    req.set(http::field::host, "localhost");
    req.body() = std::string(4096, 'x');
    req.prepare_payload();
    beast::error_code ec;
    http::write(socket, req, ec);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res, ec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(res.result_int(), 413u);
    EXPECT_FALSE(res.keep_alive());
}

TEST_F(HTTPServerTest, StopClosesStalledConnections) {
    auto server = std::make_shared<HTTPServer>(settings, handler);
    server->start();

    // one client sent half a request, another sent nothing at all
    tcp::socket stalled = connect(server->port());
    net::write(stalled, net::buffer(std::string("PROPFIND /calendars/ HTTP/1.1\r\nHost: localhost\r\n")));
    tcp::socket silent = connect(server->port());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto stopped = std::async(std::launch::async, [server]() {
        server->stop();
    });
    ASSERT_EQ(stopped.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    stopped.get();

    // both connections were shut down by the server
    char byte;
    beast::error_code ec;
    stalled.read_some(net::buffer(&byte, 1), ec);
    EXPECT_TRUE(ec);
    silent.read_some(net::buffer(&byte, 1), ec);
    EXPECT_TRUE(ec);

    server.reset();
}
