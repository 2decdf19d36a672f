#ifndef MESSAGE_HPP
#define MESSAGE_HPP

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

/*
 * ============================================================================
 * MESSAGE - Wire Frame for the Stage Protocol
 * ============================================================================
 *
 * Every command and event travels as one frame:
 *
 *   [Header: 8 bytes][Body: variable length JSON]
 *
 *   Header Format: 8-character right-aligned decimal body length
 *   Example: "      15{\"type\":\"ping\"}" = 15-byte body
 *
 * The body is always a UTF-8 JSON object with a "type" field. Framing and
 * JSON are kept apart: this class never looks inside the body.
 * ============================================================================
 */

class Message {
public:
    // ========================================================================
    // CONSTANTS - Frame Limits
    // ========================================================================
    // Sized for full stage snapshots: every queue item may carry its own
    // analysis result, and session_joined repeats the whole queue.
    static const size_t maxBytes = 4 * 1024 * 1024;  // Maximum body size
    static const size_t header = 8;                  // Header is always 8 bytes

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    // Empty frame: receiver side, header is read into it first. The body
    // space grows in decodeHeader() to whatever the frame announces.
    Message() : data(header), bodyLength_(0) {}

    // Sender side: encodes header and body immediately
    explicit Message(const std::string& body) : data(header), bodyLength_(0) {
        setBody(body);
    }

    // ========================================================================
    // SENDER OPERATIONS
    // ========================================================================

    void encodeHeader() {
        char temp_header[header + 1] = "";
        std::snprintf(temp_header, sizeof(temp_header), "%8d", static_cast<int>(bodyLength_));
        std::memcpy(data.data(), temp_header, header);
    }

    void encodeBody(const std::string& body) {
        std::memcpy(data.data() + header, body.data(), bodyLength_);
    }

    void setBody(const std::string& body) {
        setBodyLength(body.size());
        if (data.size() < header + bodyLength_) {
            data.resize(header + bodyLength_);
        }
        encodeHeader();
        encodeBody(body);
    }

    // ========================================================================
    // RECEIVER OPERATIONS
    // ========================================================================

    /*
     * decodeHeader() - Extract body length from the first 8 bytes.
     *
     * Returns false on anything that is not a length in [0, maxBytes]; the
     * connection treats that as a broken stream. On success the buffer has
     * room for the body right after the header.
     */
    bool decodeHeader() {
        char temp_header[header + 1] = "";
        std::memcpy(temp_header, data.data(), header);
        temp_header[header] = '\0';

        char* end = nullptr;
        long header_value = std::strtol(temp_header, &end, 10);
        if (end == temp_header) {
            bodyLength_ = 0;
            return false;
        }
        while (*end == ' ') {
            ++end;
        }
        if (*end != '\0' || header_value < 0 || header_value > static_cast<long>(maxBytes)) {
            bodyLength_ = 0;
            return false;
        }
        bodyLength_ = static_cast<size_t>(header_value);
        if (data.size() < header + bodyLength_) {
            data.resize(header + bodyLength_);
        }
        return true;
    }

    // ========================================================================
    // DATA ACCESS
    // ========================================================================

    std::string getData() const {
        return std::string(data.data(), header + bodyLength_);
    }

    std::string getBody() const {
        return std::string(data.data() + header, bodyLength_);
    }

    size_t getBodyLength() const {
        return bodyLength_;
    }

    size_t setBodyLength(size_t newLength) {
        if (newLength > maxBytes) {
            throw std::length_error("Message length exceeds maximum allowed size of "
                                    + std::to_string(maxBytes) + " bytes");
        }
        bodyLength_ = newLength;
        return bodyLength_;
    }

    size_t size() const {
        return header + bodyLength_;
    }

    /*
     * data - Raw buffer holding header + body
     * Public for direct buffer access by async read/write operations.
     */
    std::vector<char> data;

private:
    size_t bodyLength_;
};

#endif // MESSAGE_HPP
