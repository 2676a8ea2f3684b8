/**
 * @file stream_sink.cpp
 * @brief StreamSink implementation.
 */

#include "network/stream_sink.hpp"

namespace statsd_emitter {

Result<void> StreamSink::write(std::string_view packet) {
    if (out_ == nullptr) {
        return Error{ErrorKind::Closed, "Stream sink is closed"};
    }
    out_->write(packet.data(), static_cast<std::streamsize>(packet.size()));
    if (!*out_) {
        return Error{ErrorKind::Write, "Stream write failed"};
    }
    return Result<void>{};
}

Result<void> StreamSink::flush() {
    if (out_ == nullptr) {
        return Error{ErrorKind::Closed, "Stream sink is closed"};
    }
    out_->flush();
    if (!*out_) {
        return Error{ErrorKind::Write, "Stream flush failed"};
    }
    return Result<void>{};
}

Result<void> StreamSink::close() {
    if (out_ == nullptr) {
        return Error{ErrorKind::Closed, "Stream sink is already closed"};
    }
    auto flushed = flush();
    out_ = nullptr;
    return flushed;
}

}  // namespace statsd_emitter
