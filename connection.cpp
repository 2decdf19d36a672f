#include "connection.hpp"
#include "errors.hpp"

#include <iostream>
#include <stdexcept>

Connection::Connection(tcp::socket socket, Lobby& lobby)
    : clientSocket(std::move(socket)), lobby(lobby), closed_(false) {
}

void Connection::start() {
    // shared_from_this() is only valid once a shared_ptr owns us, hence
    // the separate start() after make_shared.
    memberId_ = lobby.connect(shared_from_this());
    async_read();
}

/*
 * deliver() - Called by the Lobby or a Stage, from any thread.
 *
 * Encoding happens here, on the caller's thread, so the strand only ever
 * sees finished frames.
 */
void Connection::deliver(const Event& event) {
    auto frame = std::make_shared<Message>(frameEvent(event));

    auto self = shared_from_this();
    boost::asio::post(clientSocket.get_executor(), [this, self, frame]() {
        if (closed_) {
            return;
        }
        outgoingMessages.push_back(std::move(*frame));
        if (outgoingMessages.size() == 1) {
            async_write();  // Nothing in flight, start the write chain
        }
    });
}

void Connection::async_read() {
    auto self = shared_from_this();
    boost::asio::async_read(clientSocket,
        boost::asio::buffer(incomingMessage.data.data(), Message::header),
        [this, self](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (!ec) {
                if (incomingMessage.decodeHeader()) {
                    readMessageBody();
                } else {
                    std::cout << "Invalid frame header from " << memberId_ << std::endl;
                    close("bad header");
                }
            } else if (ec == boost::asio::error::eof) {
                close("client disconnected");
            } else if (ec != boost::asio::error::operation_aborted) {
                std::cout << "Read error: " << ec.message() << std::endl;
                close("read error");
            }
        });
}

void Connection::readMessageBody() {
    auto self = shared_from_this();
    boost::asio::async_read(clientSocket,
        boost::asio::buffer(incomingMessage.data.data() + Message::header, incomingMessage.getBodyLength()),
        [this, self](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (!ec) {
                handleBody();
                async_read();
            } else if (ec != boost::asio::error::operation_aborted) {
                std::cout << "Read body error: " << ec.message() << std::endl;
                close("read error");
            }
        });
}

void Connection::handleBody() {
    Command command;
    try {
        command = decodeCommand(incomingMessage.getBody());
    } catch (const ProtocolError& e) {
        lobby.reportMalformed(memberId_, e.what());
        return;
    }
    memberId_ = lobby.handle(memberId_, command);
}

void Connection::async_write() {
    if (outgoingMessages.empty() || closed_) {
        return;
    }

    auto self = shared_from_this();
    const Message& msg = outgoingMessages.front();
    boost::asio::async_write(clientSocket,
        boost::asio::buffer(msg.data.data(), msg.size()),
        [this, self](boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
            if (!ec) {
                outgoingMessages.pop_front();
                if (!outgoingMessages.empty()) {
                    async_write();
                }
            } else if (ec != boost::asio::error::operation_aborted) {
                std::cout << "Write error: " << ec.message() << std::endl;
                close("write error");
            }
        });
}

void Connection::close(const char* reason) {
    if (closed_) {
        return;
    }
    closed_ = true;
    outgoingMessages.clear();

    boost::system::error_code ec;
    clientSocket.shutdown(tcp::socket::shutdown_both, ec);
    clientSocket.close(ec);
    if (ec) {
        std::cerr << "Close error for " << memberId_ << ": " << ec.message() << std::endl;
    }
    std::cout << "Connection for " << memberId_ << " closed (" << reason << ")" << std::endl;

    lobby.disconnect(memberId_);
}

Message frameEvent(const Event& event) {
    try {
        return Message(encodeEvent(event));
    } catch (const std::length_error& e) {
        std::cerr << "Event " << typeOf(event) << " too large to send: " << e.what() << std::endl;
    }
    evt::Error error;
    error.code = errorCode(ErrorKind::FrameTooLarge);
    error.message = std::string("Could not send ") + typeOf(event) + ", state may be out of date";
    return Message(encodeEvent(error));
}

void start_accept(tcp::acceptor& acceptor, Lobby& lobby) {
    auto socket = std::make_shared<tcp::socket>(boost::asio::make_strand(acceptor.get_executor()));
    acceptor.async_accept(*socket,
        [&acceptor, &lobby, socket](boost::system::error_code ec) {
            if (!ec) {
                std::cout << "New client connected from " << socket->remote_endpoint(ec) << std::endl;
                auto connection = std::make_shared<Connection>(std::move(*socket), lobby);
                connection->start();
            } else if (ec == boost::asio::error::operation_aborted) {
                return;  // Acceptor closed, server is shutting down
            } else {
                std::cout << "Accept error: " << ec.message() << std::endl;
            }
            start_accept(acceptor, lobby);
        });
}
