#include "seep/channel/encrypted_stream.hpp"
#include "seep/core/constants.hpp"
#include "seep/debug/trace_logger.hpp"

#include <algorithm>
#include <cstring>
#include <string>

namespace seep::protocol::channel {

Result<Unit, ProtocolFailure> EncryptedWriter::SendRecordLocked(std::span<const uint8_t> data) {
    auto sealed = cipher_.Encrypt(data);
    if (sealed.IsErr()) {
        poisoned_ = true;
        debug::LogStreamFailure("writer", sealed.UnwrapErr().message);
        return Result<Unit, ProtocolFailure>::Err(std::move(sealed).UnwrapErr());
    }
    if (auto sent = transport_.SendFrame(sealed.Unwrap()); sent.IsErr()) {
        poisoned_ = true;
        debug::LogStreamFailure("writer", sent.UnwrapErr().message);
        return sent;
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> EncryptedWriter::DrainBacklogLocked() {
    if (backlog_.empty()) {
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    std::vector<uint8_t> backlog = std::move(backlog_);
    backlog_.clear();
    return SendRecordLocked(backlog);
}

Result<size_t, ProtocolFailure> EncryptedWriter::Write(std::span<const uint8_t> data) {
    std::lock_guard<std::mutex> guard(lock_);
    if (unreported_failure_.has_value()) {
        ProtocolFailure failure = std::move(*unreported_failure_);
        unreported_failure_.reset();
        return Result<size_t, ProtocolFailure>::Err(std::move(failure));
    }
    if (poisoned_) {
        return Result<size_t, ProtocolFailure>::Err(
            ProtocolFailure::ObjectDisposed(std::string(ErrorMessages::STREAM_POISONED)));
    }
    if (auto drained = DrainBacklogLocked(); drained.IsErr()) {
        return Result<size_t, ProtocolFailure>::Err(std::move(drained).UnwrapErr());
    }
    if (auto sent = SendRecordLocked(data); sent.IsErr()) {
        return Result<size_t, ProtocolFailure>::Err(std::move(sent).UnwrapErr());
    }
    return Result<size_t, ProtocolFailure>::Ok(data.size());
}

void EncryptedWriter::Flush() {
    std::lock_guard<std::mutex> guard(lock_);
    if (poisoned_) {
        return;
    }
    if (auto drained = DrainBacklogLocked(); drained.IsErr()) {
        unreported_failure_ = std::move(drained).UnwrapErr();
    }
}

Result<size_t, ProtocolFailure> EncryptedReader::Read(std::span<uint8_t> buffer) {
    std::lock_guard<std::mutex> guard(lock_);
    return ReadLocked(buffer);
}

Result<size_t, ProtocolFailure> EncryptedReader::ReadLocked(std::span<uint8_t> buffer) {
    if (buffer.empty()) {
        return Result<size_t, ProtocolFailure>::Ok(0);
    }
    if (poisoned_) {
        return Result<size_t, ProtocolFailure>::Err(
            ProtocolFailure::ObjectDisposed(std::string(ErrorMessages::STREAM_POISONED)));
    }
    while (offset_ >= buffer_.size()) {
        auto frame = transport_.ReceiveFrame();
        if (frame.IsErr()) {
            poisoned_ = true;
            debug::LogStreamFailure("reader", frame.UnwrapErr().message);
            return Result<size_t, ProtocolFailure>::Err(std::move(frame).UnwrapErr());
        }
        auto opened = cipher_.Decrypt(frame.Unwrap());
        if (opened.IsErr()) {
            poisoned_ = true;
            debug::LogStreamFailure("reader", opened.UnwrapErr().message);
            return Result<size_t, ProtocolFailure>::Err(std::move(opened).UnwrapErr());
        }
        buffer_ = std::move(opened).Unwrap();
        offset_ = 0;
    }
    const size_t count = std::min(buffer.size(), buffer_.size() - offset_);
    std::memcpy(buffer.data(), buffer_.data() + offset_, count);
    offset_ += count;
    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    }
    return Result<size_t, ProtocolFailure>::Ok(count);
}

Result<Unit, ProtocolFailure> EncryptedReader::ReadExact(std::span<uint8_t> buffer) {
    std::lock_guard<std::mutex> guard(lock_);
    size_t filled = 0;
    while (filled < buffer.size()) {
        auto read = ReadLocked(buffer.subspan(filled));
        if (read.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(read).UnwrapErr());
        }
        filled += read.Unwrap();
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

} // namespace seep::protocol::channel
