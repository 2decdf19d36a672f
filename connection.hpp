#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include "lobby.hpp"
#include "message.hpp"
#include "participant.hpp"

#include <boost/asio.hpp>

#include <deque>
#include <memory>
#include <string>

/*
 * ============================================================================
 * CONNECTION - One Client Socket
 * ============================================================================
 *
 * Read header, read body, hand it over, read the next header; write from a
 * queue, one async_write at a time.
 *
 *   async_read(header) --> decodeHeader --> readMessageBody --> Lobby::handle
 *         ^                                                          |
 *         +----------------------------------------------------------+
 *
 *   deliver(event) --post--> outgoingMessages --> async_write --> pop, next
 *
 * Two rules:
 *
 *   1. Events come from any io thread (whichever thread is running the Stage
 *      that produced them). The socket lives on a strand and deliver() only
 *      posts onto it, so the outgoing queue is never touched concurrently and
 *      the caller (possibly holding a stage lock) never blocks on the network.
 *
 *   2. A bad body is not fatal. If the JSON does not decode into a command the
 *      member gets an "error" event and the connection keeps reading. Only a
 *      header that is not a length in range closes the connection, because
 *      after that the byte stream can no longer be framed.
 * ============================================================================
 */

using boost::asio::ip::tcp;

class Connection : public Participant, public std::enable_shared_from_this<Connection> {
public:
    // The socket must have been created on a strand.
    Connection(tcp::socket socket, Lobby& lobby);

    void start();
    void deliver(const Event& event) override;

    const std::string& memberId() const { return memberId_; }

private:
    void async_read();
    void readMessageBody();
    void handleBody();
    void async_write();
    void close(const char* reason);

    tcp::socket clientSocket;
    Lobby& lobby;
    std::string memberId_;
    bool closed_;
    Message incomingMessage;
    std::deque<Message> outgoingMessages;
};

// Encodes an event into one frame. An event too large for a frame becomes a
// frame_too_large error naming it, so the member knows its view is stale.
Message frameEvent(const Event& event);

// Accepts forever, one Connection per client, each on its own strand.
void start_accept(tcp::acceptor& acceptor, Lobby& lobby);

#endif // CONNECTION_HPP
