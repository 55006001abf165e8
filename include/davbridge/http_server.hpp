/** HTTPServer [DAVBridge]
 *
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef HTTPServer_hpp
#define HTTPServer_hpp

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "spdlog/spdlog.h"
#include "davbridge/caldav_handler.hpp"

struct ServerSettings {
    std::string host = "0.0.0.0";
    unsigned short port = 5082;
    int idleTimeoutSeconds = 30;
    size_t bodyLimit = 1024 * 1024;
};

/*
 Accepts connections on an asio io_context thread and serves each one on its
 own thread with blocking Beast reads and writes, keeping the connection
 alive between requests. stop() closes the listener, shuts down every open
 connection and joins their threads, so no connection outlives the server.
 */
class HTTPServer {
    ServerSettings _settings;
    std::shared_ptr<CalDAVHandler> _handler;
    std::shared_ptr<spdlog::logger> logger;

    boost::asio::io_context _ioc;
    boost::asio::ip::tcp::acceptor _acceptor;
    std::thread * _ioThread = nullptr;
    std::atomic<bool> _stopping;

    // connection threads are joined by stop(); finished ones are reaped on accept
    std::mutex _connMtx;
    std::set<std::shared_ptr<boost::asio::ip::tcp::socket>> _connections;
    std::map<std::thread::id, std::thread> _workers;
    std::vector<std::thread::id> _finishedWorkers;

public:
    HTTPServer(ServerSettings settings, std::shared_ptr<CalDAVHandler> handler);
    ~HTTPServer();

    void start();
    void stop();

    unsigned short port() const;

    static DAVRequest toDAVRequest(const boost::beast::http::request<boost::beast::http::string_body> & req);

private:
    void doAccept();
    void reapWorkers();
    void serveConnection(std::shared_ptr<boost::asio::ip::tcp::socket> socket);
    void writeResponse(boost::asio::ip::tcp::socket & socket, const DAVResponse & response, unsigned version, bool keepAlive, bool head, boost::beast::error_code & ec);
};

#endif /* HTTPServer_hpp */
