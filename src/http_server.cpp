#include "davbridge/http_server.hpp"
#include "davbridge/bridge_utils.hpp"
#include "davbridge/generic_exception.hpp"
#include "davbridge/logging.hpp"
#include "davbridge/thread_utils.hpp"

#include <sys/socket.h>
#include <sys/time.h>

using namespace std;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

template <class Body>
static void applyHeaders(http::response<Body> & res, const DAVResponse & response, bool keepAlive) {
    res.set(http::field::server, "DAVBridge");
    for (const auto & pair : response.headers) {
        if (BridgeUtils::toLowerCase(pair.first) == "content-length") {
            continue;
        }
        res.set(pair.first, pair.second);
    }
    res.keep_alive(keepAlive);
}

HTTPServer::HTTPServer(ServerSettings settings, shared_ptr<CalDAVHandler> handler) :
    _settings(settings),
    _handler(handler),
    logger(Logging::get("http")),
    _ioc(1),
    _acceptor(_ioc),
    _stopping(false)
{
}

HTTPServer::~HTTPServer() {
    stop();
}

unsigned short HTTPServer::port() const {
    beast::error_code ec;
    auto endpoint = _acceptor.local_endpoint(ec);
    return ec ? _settings.port : endpoint.port();
}

void HTTPServer::start() {
    beast::error_code ec;
    auto address = net::ip::make_address(_settings.host, ec);
    if (ec) {
        throw GenericException("Invalid listen address " + _settings.host + ": " + ec.message());
    }
    tcp::endpoint endpoint(address, _settings.port);

    _acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        _acceptor.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        _acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        _acceptor.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        throw GenericException("Unable to listen on " + _settings.host + ":" + to_string(_settings.port) + ": " + ec.message());
    }

    logger->info("Listening on {}:{}", _settings.host, port());
    doAccept();

    _ioThread = new std::thread([this]() {
        SetThreadName("http-accept");
        _ioc.run();
    });
}

void HTTPServer::doAccept() {
    auto socket = make_shared<tcp::socket>(_ioc);
    _acceptor.async_accept(*socket, [this, socket](beast::error_code ec) {
        if (ec) {
            if (ec != net::error::operation_aborted) {
                logger->warn("Accept failed: {}", ec.message());
            }
        } else if (!_stopping) {
            lock_guard<mutex> lock(_connMtx);
            reapWorkers();
            _connections.insert(socket);
            std::thread worker([this, socket]() {
                serveConnection(socket);
            });
            auto id = worker.get_id();
            _workers.emplace(id, std::move(worker));
        }
        if (!_stopping && _acceptor.is_open()) {
            doAccept();
        }
    });
}

DAVRequest HTTPServer::toDAVRequest(const http::request<http::string_body> & req) {
    DAVRequest request;
    auto method = req.method_string();
    request.method = string(method.data(), method.size());

    auto targetView = req.target();
    string target(targetView.data(), targetView.size());
    size_t query = target.find('?');
    if (query != string::npos) {
        request.query = target.substr(query + 1);
        target = target.substr(0, query);
    }
    request.path = target == "" ? "/" : target;

    for (const auto & field : req) {
        auto name = field.name_string();
        auto value = field.value();
        request.headers[BridgeUtils::toLowerCase(string(name.data(), name.size()))] = string(value.data(), value.size());
    }
    request.body = req.body();
    return request;
}

void HTTPServer::writeResponse(tcp::socket & socket, const DAVResponse & response, unsigned version, bool keepAlive, bool head, beast::error_code & ec) {
    if (head) {
        http::response<http::empty_body> res{static_cast<http::status>(response.status), version};
        applyHeaders(res, response, keepAlive);
        auto length = response.headers.find("Content-Length");
        res.content_length(length != response.headers.end() ? stoull(length->second) : response.body.size());
        http::write(socket, res, ec);
        return;
    }

    http::response<http::string_body> res{static_cast<http::status>(response.status), version};
    applyHeaders(res, response, keepAlive);
    res.body() = response.body;
    res.prepare_payload();
    http::write(socket, res, ec);
}

void HTTPServer::serveConnection(shared_ptr<tcp::socket> socket) {
    SetThreadName("http");

    // blocking reads give up after the idle timeout
    struct timeval tv;
    tv.tv_sec = _settings.idleTimeoutSeconds;
    tv.tv_usec = 0;
    setsockopt(socket->native_handle(), SOL_SOCKET, SO_RCVTIMEO, (const char *)&tv, sizeof(tv));

    beast::flat_buffer buffer;
    beast::error_code ec;

    while (!_stopping) {
        http::request_parser<http::string_body> parser;
        parser.header_limit(16 * 1024);
        parser.body_limit(_settings.bodyLimit);

        http::read(*socket, buffer, parser, ec);
        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec == http::error::body_limit) {
            DAVResponse tooLarge(413, "Request body too large\n", "text/plain; charset=utf-8");
            writeResponse(*socket, tooLarge, 11, false, false, ec);
            break;
        }
        if (ec) {
            if (ec != net::error::would_block && ec != net::error::try_again && ec != net::error::connection_reset && ec != net::error::eof) {
                logger->debug("Closing connection after read error: {}", ec.message());
            }
            break;
        }

        const auto & req = parser.get();
        DAVResponse response = _handler->handle(toDAVRequest(req));

        bool keepAlive = req.keep_alive() && !_stopping;
        writeResponse(*socket, response, req.version(), keepAlive, req.method() == http::verb::head, ec);
        if (ec) {
            logger->debug("Closing connection after write error: {}", ec.message());
            break;
        }
        if (!keepAlive) {
            break;
        }
    }

    // stop() may be shutting the socket down concurrently
    lock_guard<mutex> lock(_connMtx);
    beast::error_code ignored;
    socket->shutdown(tcp::socket::shutdown_both, ignored);
    socket->close(ignored);
    _connections.erase(socket);
    _finishedWorkers.push_back(std::this_thread::get_id());
}

// Called with _connMtx held. A finished worker only has to return, so the
// join is immediate.
void HTTPServer::reapWorkers() {
    for (const auto & id : _finishedWorkers) {
        auto it = _workers.find(id);
        if (it != _workers.end()) {
            it->second.join();
            _workers.erase(it);
        }
    }
    _finishedWorkers.clear();
}

void HTTPServer::stop() {
    if (_stopping.exchange(true)) {
        return;
    }

    if (_ioThread != nullptr) {
        _ioc.stop();
        _ioThread->join();
        delete _ioThread;
        _ioThread = nullptr;
    }
    beast::error_code closeError;
    _acceptor.close(closeError);

    map<std::thread::id, std::thread> workers;
    {
        lock_guard<mutex> lock(_connMtx);
        // wakes connections blocked in a read or a write
        for (const auto & socket : _connections) {
            beast::error_code ignored;
            socket->shutdown(tcp::socket::shutdown_both, ignored);
        }
        if (!_workers.empty()) {
            logger->info("Waiting for {} connection(s) to close", _workers.size());
        }
        workers.swap(_workers);
        _finishedWorkers.clear();
    }
    for (auto & pair : workers) {
        pair.second.join();
    }
    logger->info("HTTP server stopped");
}
