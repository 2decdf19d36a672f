#ifndef DIRECTORYHTTP_HPP
#define DIRECTORYHTTP_HPP

#include "registry.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <memory>

/*
 * ============================================================================
 * DIRECTORY HTTP - Public Stage Listing for Clients Not Yet Connected
 * ============================================================================
 *
 * Clients that are sitting on the menu without a session socket poll
 *
 *     GET /sessions/public   ->  200  [ SessionSummary, ... ]
 *
 * Anything else on that port gets 404 (unknown path) or 405 (other method).
 * The listing is read straight from the SessionRegistry; there is no cache.
 * ============================================================================
 */

namespace beast = boost::beast;
namespace http = beast::http;

// Builds the reply for one request. Separate from the I/O so tests can call it.
http::response<http::string_body> handleDirectoryRequest(const http::request<http::string_body>& request,
                                                         const SessionRegistry& registry);

class DirectoryHttpSession : public std::enable_shared_from_this<DirectoryHttpSession> {
public:
    DirectoryHttpSession(boost::asio::ip::tcp::socket socket, const SessionRegistry& registry);

    void start();

private:
    void readRequest();
    void writeResponse();
    void close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    std::shared_ptr<http::response<http::string_body>> response_;
    const SessionRegistry& registry_;
};

void start_directory_accept(boost::asio::ip::tcp::acceptor& acceptor, const SessionRegistry& registry);

#endif // DIRECTORYHTTP_HPP
