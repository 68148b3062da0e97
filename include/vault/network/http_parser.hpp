#pragma once

#include "vault/network/http_types.hpp"
#include "vault/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace vault {
namespace network {

/**
 * @brief State machine states for HTTP request parsing
 *
 * HTTP Request Format:
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Optional body, Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Feed data as it arrives from the socket. The request line and headers
 * are consumed character by character; the body is copied in bulk since
 * upload chunks run to several megabytes.
 *
 * Usage example:
 * ```cpp
 * HttpParser parser(max_body_bytes);
 * auto result = parser.parse(buffer.data(), n);
 * if (result.is_error()) { ... }
 * if (result.value()) {
 *     HttpRequest request = parser.take_request();
 * }
 * ```
 *
 * Errors carry ErrorCode::InvalidArgument for malformed input and
 * ErrorCode::FileTooLarge when Content-Length exceeds the body limit.
 */
class HttpParser {
public:
    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    explicit HttpParser(size_t max_body_bytes = 64 * 1024 * 1024)
        : max_body_bytes_(max_body_bytes) {
        reset();
    }

    /**
     * @brief Parse incoming data
     *
     * @return true once a full request is available, false if more data is
     *         needed, or an error
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return malformed("Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                const size_t wanted = expected_body_ - request_.body.size();
                const size_t take = std::min(wanted, len - i);
                request_.body.insert(request_.body.end(), data + i, data + i + take);
                i += take;
                if (request_.body.size() >= expected_body_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            char c = data[i++];
            if (++header_bytes_ > kMaxHeaderBytes) {
                state_ = ParseState::PARSE_ERROR;
                return malformed("Request head exceeds " + std::to_string(kMaxHeaderBytes) + " bytes");
            }

            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD:
                    ok = parse_method(c);
                    break;
                case ParseState::URL:
                    ok = parse_url(c);
                    break;
                case ParseState::VERSION:
                    ok = parse_version(c);
                    break;
                case ParseState::HEADER_NAME: {
                    auto r = parse_header_name(c);
                    if (r.is_error()) {
                        state_ = ParseState::PARSE_ERROR;
                        return Err<bool>(r.error());
                    }
                    break;
                }
                case ParseState::HEADER_VALUE:
                    ok = parse_header_value(c);
                    break;
                default:
                    break;
            }

            if (!ok) {
                const std::string where = state_name();
                state_ = ParseState::PARSE_ERROR;
                return malformed("Failed to parse " + where + " at line " + std::to_string(line_));
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    const HttpRequest& get_request() const {
        return request_;
    }

    /// Move the completed request out; the parser must be reset afterwards.
    HttpRequest take_request() {
        return std::move(request_);
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        expected_body_ = 0;
        header_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    size_t max_body_bytes_;
    size_t expected_body_;
    size_t header_bytes_;
    size_t line_;
    bool last_char_was_cr_;

    static Result<bool> malformed(std::string message) {
        return Err<bool>(Error(ErrorCode::InvalidArgument, std::move(message)));
    }

    std::string state_name() const {
        switch (state_) {
            case ParseState::METHOD: return "HTTP method";
            case ParseState::URL: return "URL";
            case ParseState::VERSION: return "HTTP version";
            case ParseState::HEADER_NAME: return "header name";
            case ParseState::HEADER_VALUE: return "header value";
            default: return "request";
        }
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    /**
     * @brief Header name, or the empty line that ends the head
     *
     * At the empty line Content-Length is validated once and decides
     * whether a body follows.
     */
    Result<void> parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return Ok();
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            if (!buffer_.empty()) {
                return Err<void>(Error(ErrorCode::InvalidArgument, "Header without value"));
            }

            if (request_.has_header("Transfer-Encoding")) {
                return Err<void>(Error(ErrorCode::InvalidArgument, "Transfer-Encoding is not supported"));
            }

            const std::string content_length = request_.get_header("Content-Length");
            if (!content_length.empty()) {
                if (!std::all_of(content_length.begin(), content_length.end(),
                                 [](unsigned char ch) { return std::isdigit(ch) != 0; })
                    || content_length.size() > 19) {
                    return Err<void>(Error(ErrorCode::InvalidArgument, "Invalid Content-Length"));
                }
                const size_t body_length = std::stoull(content_length);
                if (body_length > max_body_bytes_) {
                    return Err<void>(Error(ErrorCode::FileTooLarge,
                                           "Body of " + content_length + " bytes exceeds limit of " +
                                           std::to_string(max_body_bytes_)));
                }
                if (body_length > 0) {
                    expected_body_ = body_length;
                    request_.body.reserve(body_length);
                    state_ = ParseState::BODY;
                    return Ok();
                }
            }

            state_ = ParseState::COMPLETE;
            return Ok();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return Err<void>(Error(ErrorCode::InvalidArgument, "Empty header name"));
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return Ok();
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return Err<void>(Error(ErrorCode::InvalidArgument,
                                   "Invalid character in header name at line " + std::to_string(line_)));
        }

        buffer_ += c;
        return Ok();
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && c == ' ') {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }
};

} // namespace network
} // namespace vault
