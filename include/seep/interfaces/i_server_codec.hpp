#pragma once
#include "seep/core/result.hpp"
#include "seep/core/failures.hpp"
#include "rpc/envelope.pb.h"
namespace seep::protocol::interfaces {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
/**
 * Server half of a remote-call codec.
 *
 * WriteResponse may be called from several threads; ReadRequestHeader and
 * ReadRequestBody are called in pairs by a single reader thread.
 */
class IServerCodec {
public:
    virtual ~IServerCodec() = default;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> ReadRequestHeader(
        proto::rpc::RequestHeader& header) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> ReadRequestBody(
        google::protobuf::Message* body) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> WriteResponse(
        const proto::rpc::ResponseHeader& header,
        const google::protobuf::Message* body) = 0;
    virtual void Close() = 0;
};
}
