#include "directoryHttp.hpp"

#include <chrono>
#include <iostream>

using boost::asio::ip::tcp;

namespace {

const char* const serverName = "stagesync";

http::response<http::string_body> textResponse(const http::request<http::string_body>& request,
                                               http::status status, const std::string& body) {
    http::response<http::string_body> response{status, request.version()};
    response.set(http::field::server, serverName);
    response.set(http::field::content_type, "text/plain");
    response.keep_alive(request.keep_alive());
    response.body() = body;
    response.prepare_payload();
    return response;
}

}  // namespace

http::response<http::string_body> handleDirectoryRequest(const http::request<http::string_body>& request,
                                                         const SessionRegistry& registry) {
    std::string target(request.target());
    size_t query = target.find('?');
    if (query != std::string::npos) {
        target.resize(query);
    }

    if (target != "/sessions/public") {
        return textResponse(request, http::status::not_found, "Not found");
    }
    if (request.method() != http::verb::get) {
        http::response<http::string_body> response =
            textResponse(request, http::status::method_not_allowed, "Method not allowed");
        response.set(http::field::allow, "GET");
        return response;
    }

    json list = registry.publicSessions();

    http::response<http::string_body> response{http::status::ok, request.version()};
    response.set(http::field::server, serverName);
    response.set(http::field::content_type, "application/json");
    response.set(http::field::access_control_allow_origin, "*");
    response.keep_alive(request.keep_alive());
    response.body() = list.dump();
    response.prepare_payload();
    return response;
}

DirectoryHttpSession::DirectoryHttpSession(tcp::socket socket, const SessionRegistry& registry)
    : stream_(std::move(socket)), registry_(registry) {
}

void DirectoryHttpSession::start() {
    readRequest();
}

void DirectoryHttpSession::readRequest() {
    request_ = {};
    stream_.expires_after(std::chrono::seconds(30));

    auto self = shared_from_this();
    http::async_read(stream_, buffer_, request_,
        [this, self](beast::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec == http::error::end_of_stream) {
                close();
                return;
            }
            if (ec) {
                if (ec != beast::error::timeout) {
                    std::cout << "Directory read error: " << ec.message() << std::endl;
                }
                close();
                return;
            }
            writeResponse();
        });
}

void DirectoryHttpSession::writeResponse() {
    response_ = std::make_shared<http::response<http::string_body>>(handleDirectoryRequest(request_, registry_));

    auto self = shared_from_this();
    http::async_write(stream_, *response_,
        [this, self](beast::error_code ec, std::size_t /*bytes_transferred*/) {
            if (ec) {
                std::cout << "Directory write error: " << ec.message() << std::endl;
                close();
                return;
            }
            if (!response_->keep_alive()) {
                close();
                return;
            }
            readRequest();
        });
}

void DirectoryHttpSession::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) {
        std::cerr << "Directory shutdown error: " << ec.message() << std::endl;
    }
}

void start_directory_accept(tcp::acceptor& acceptor, const SessionRegistry& registry) {
    acceptor.async_accept(boost::asio::make_strand(acceptor.get_executor()),
        [&acceptor, &registry](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<DirectoryHttpSession>(std::move(socket), registry)->start();
            } else if (ec == boost::asio::error::operation_aborted) {
                return;
            } else {
                std::cout << "Directory accept error: " << ec.message() << std::endl;
            }
            start_directory_accept(acceptor, registry);
        });
}
