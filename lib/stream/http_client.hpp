// SPDX-License-Identifier: MIT

// lib/stream/http_client.hpp
#pragma once

#include <llhttp.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"

namespace llm_fanout {

// HttpClient parses one HTTP/1.1 response using llhttp.
// Sits between TcpConnection (upstream) and the response body consumer
// (downstream).
//
// - 2xx bodies are forwarded to downstream OnData as they arrive, whatever
//   the framing (Content-Length, chunked, or close-delimited).
// - Status >= 300 bodies are captured (bounded) and reported as a single
//   OnError once the message ends.
// - End of message emits OnDone. So does EOF from upstream before the
//   message ended: the byte stream is over either way, and the body
//   consumer decides whether what it received was complete.
//   IsMessageComplete() tells the two cases apart.
//
// Template parameter D must satisfy the Downstream concept.
template <Downstream D>
class HttpClient : public PipelineComponent<HttpClient<D>>,
                   public std::enable_shared_from_this<HttpClient<D>> {
public:
    // Factory method for shared_from_this safety
    static std::shared_ptr<HttpClient> Create(IEventLoop& loop,
                                               std::shared_ptr<D> downstream) {
        struct MakeSharedEnabler : public HttpClient {
            MakeSharedEnabler(IEventLoop& l, std::shared_ptr<D> ds)
                : HttpClient(l, std::move(ds)) {}
        };
        return std::make_shared<MakeSharedEnabler>(loop, std::move(downstream));
    }

    ~HttpClient() = default;

    // Downstream interface: receive raw response bytes from TcpConnection
    void OnData(BufferChain& data);

    // Forward errors from upstream
    void OnError(const Error& e);

    // Handle EOF from upstream
    void OnDone();

    // Required by PipelineComponent
    void DisableWatchers() {
        // No direct epoll watchers; HTTP operates on parsed data
    }

    void DoClose() {
        body_chain_.Clear();
        downstream_.reset();
    }

    // Accessors
    int StatusCode() const { return status_code_; }
    bool IsMessageComplete() const { return message_complete_; }

    // True if the connection can carry another request after this response
    bool ShouldKeepAlive() const { return message_complete_ && keep_alive_; }

private:
    HttpClient(IEventLoop& loop, std::shared_ptr<D> downstream);

    // llhttp callbacks (static, use parser->data to get this pointer)
    static int OnStatus(llhttp_t* parser, const char* at, size_t len);
    static int OnHeadersComplete(llhttp_t* parser);
    static int OnBody(llhttp_t* parser, const char* at, size_t len);
    static int OnMessageComplete(llhttp_t* parser);

    // Map HTTP status code to ErrorCode
    static ErrorCode StatusToErrorCode(int status) {
        if (status == 404) return ErrorCode::NotFound;
        if (status >= 500) return ErrorCode::ServerError;
        return ErrorCode::HttpError;
    }

    // Emit HTTP status error (status >= 300) and request close
    void EmitHttpStatusError() {
        std::string msg = "HTTP " + std::to_string(status_code_);
        if (!error_body_.empty()) {
            msg += ": " + error_body_;
        }
        if (downstream_) {
            this->EmitError(*downstream_, Error{StatusToErrorCode(status_code_), std::move(msg)});
        }
        this->RequestClose();
    }

    // Handle llhttp parse error. Returns true if caller should stop feeding.
    bool HandleParseError(llhttp_errno_t err) {
        if (err == HPE_OK) return false;
        if (err == HPE_PAUSED || err == HPE_USER) {
            return true;  // Message complete or error already emitted in callback
        }
        if (downstream_) {
            this->EmitError(*downstream_, Error{ErrorCode::HttpError,
                std::string("invalid HTTP response: ") + llhttp_errno_name(err)});
        }
        this->RequestClose();
        return true;
    }

    std::shared_ptr<D> downstream_;

    // llhttp state
    llhttp_t parser_;
    llhttp_settings_t settings_;

    // HTTP response state
    int status_code_ = 0;
    bool message_complete_ = false;
    bool keep_alive_ = false;

    // Body bytes handed to downstream
    BufferChain body_chain_;

    // Error body for HTTP errors (status >= 300)
    std::string error_body_;

    static constexpr size_t kMaxErrorBodySize = 4096;
};

// Implementation - must be in header due to template

template <Downstream D>
HttpClient<D>::HttpClient(IEventLoop& loop, std::shared_ptr<D> downstream)
    : PipelineComponent<HttpClient<D>>(loop), downstream_(std::move(downstream)) {
    llhttp_settings_init(&settings_);
    settings_.on_status = OnStatus;
    settings_.on_headers_complete = OnHeadersComplete;
    settings_.on_body = OnBody;
    settings_.on_message_complete = OnMessageComplete;

    // Initialize parser for HTTP response parsing
    llhttp_init(&parser_, HTTP_RESPONSE, &settings_);
    parser_.data = this;
}

template <Downstream D>
void HttpClient<D>::OnData(BufferChain& data) {
    auto guard = this->TryGuard();
    if (!guard) {
        data.Consume(data.Size());
        return;
    }

    while (!data.Empty() && !this->IsClosed()) {
        size_t chunk_size = data.ContiguousSize();
        const char* chunk_ptr = reinterpret_cast<const char*>(data.DataAt(0));

        auto err = llhttp_execute(&parser_, chunk_ptr, chunk_size);
        data.Consume(chunk_size);

        if (HandleParseError(err)) break;
    }
    // Anything after the end of the message is not ours to interpret
    data.Consume(data.Size());
}

template <Downstream D>
void HttpClient<D>::OnError(const Error& e) {
    if (!downstream_) return;
    this->PropagateError(*downstream_, e);
}

template <Downstream D>
void HttpClient<D>::OnDone() {
    auto guard = this->TryGuard();
    if (!guard) return;

    if (!message_complete_ && status_code_ != 0) {
        // Close-delimited bodies end here; a truncated chunked body
        // reports HPE_INVALID_EOF_STATE and is handled as end of stream
        llhttp_errno_t err = llhttp_finish(&parser_);
        if (err == HPE_USER) return;
    }

    if (this->IsFinalized()) return;

    if (status_code_ == 0) {
        if (downstream_) {
            this->EmitError(*downstream_, Error{ErrorCode::ConnectionClosedEarly,
                "connection closed before HTTP response"});
        }
        this->RequestClose();
        return;
    }

    if (status_code_ >= 300) {
        EmitHttpStatusError();
        return;
    }

    if (downstream_) this->EmitDone(*downstream_);
    this->RequestClose();
}

// llhttp callback implementations

template <Downstream D>
int HttpClient<D>::OnStatus(llhttp_t* parser, const char*, size_t) {
    auto* self = static_cast<HttpClient*>(parser->data);
    self->status_code_ = static_cast<int>(parser->status_code);
    return 0;
}

template <Downstream D>
int HttpClient<D>::OnHeadersComplete(llhttp_t* parser) {
    auto* self = static_cast<HttpClient*>(parser->data);
    self->status_code_ = static_cast<int>(parser->status_code);
    if (self->status_code_ >= 300) {
        self->error_body_.clear();
    }
    return 0;
}

template <Downstream D>
int HttpClient<D>::OnBody(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpClient*>(parser->data);

    // For HTTP errors, capture body for error message
    if (self->status_code_ >= 300) {
        size_t remaining = kMaxErrorBodySize - self->error_body_.size();
        self->error_body_.append(at, std::min(len, remaining));
        return 0;
    }

    if (!self->downstream_) return HPE_USER;

    self->body_chain_.AppendBytes(reinterpret_cast<const std::byte*>(at), len);
    self->downstream_->OnData(self->body_chain_);
    // Downstream consumes what it needs; leftovers are its responsibility
    self->body_chain_.Clear();

    // Downstream may have torn the stream down from inside OnData
    return self->IsClosed() ? HPE_USER : 0;
}

template <Downstream D>
int HttpClient<D>::OnMessageComplete(llhttp_t* parser) {
    auto* self = static_cast<HttpClient*>(parser->data);
    self->message_complete_ = true;
    self->keep_alive_ = llhttp_should_keep_alive(parser) != 0;

    if (self->status_code_ >= 300) {
        self->EmitHttpStatusError();
        return HPE_USER;
    }

    if (self->downstream_) self->EmitDone(*self->downstream_);
    self->RequestClose();
    // Stop parsing: bytes after this message belong to nobody
    return HPE_PAUSED;
}

}  // namespace llm_fanout
