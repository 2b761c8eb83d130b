#pragma once
#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "rpc/envelope.pb.h"
namespace seep::protocol::interfaces {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
/**
 * Client half of a remote-call codec.
 *
 * WriteRequest may be called from several threads; ReadResponseHeader and
 * ReadResponseBody are called in pairs by a single reader thread.
 */
class IClientCodec {
public:
    virtual ~IClientCodec() = default;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> WriteRequest(
        const proto::rpc::RequestHeader& header,
        const google::protobuf::Message* body) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> ReadResponseHeader(
        proto::rpc::ResponseHeader& header) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> ReadResponseBody(
        google::protobuf::Message* body) = 0;
    virtual void Close() = 0;
};
}
