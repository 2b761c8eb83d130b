#include "seep/channel/handshake_driver.hpp"
#include "seep/noise/handshake_state.hpp"
#include "seep/debug/trace_logger.hpp"

#include <optional>
#include <string>

namespace seep::protocol::channel {

using noise::HandshakeState;

Result<HandshakeResult, ProtocolFailure> HandshakeDriver::Run(
    IFrameTransport& transport,
    const noise::HandshakeConfig& config,
    const PayloadProducer& produce,
    const PayloadConsumer& consume) {
    using RunResult = Result<HandshakeResult, ProtocolFailure>;

    auto created = HandshakeState::Create(config);
    if (created.IsErr()) {
        debug::LogHandshakeFailed(config.role, created.UnwrapErr().message);
        return RunResult::Err(std::move(created).UnwrapErr());
    }
    HandshakeState state = std::move(created).Unwrap();
    debug::LogHandshakeStart(config.role, config.ProtocolNameString(), state.MessagesToSend());

    auto fail = [&config](ProtocolFailure failure) {
        debug::LogHandshakeFailed(config.role, failure.message);
        return RunResult::Err(std::move(failure));
    };

    for (size_t round = 0;; ++round) {
        std::optional<noise::CipherStatePair> ciphers;
        if (state.IsMyTurn()) {
            std::vector<uint8_t> payload = produce ? produce() : std::vector<uint8_t>{};
            auto written = state.WriteMessage(payload);
            if (written.IsErr()) {
                return fail(std::move(written).UnwrapErr());
            }
            noise::WriteOutcome outcome = std::move(written).Unwrap();
            if (auto sent = transport.SendFrame(outcome.message); sent.IsErr()) {
                return fail(sent.UnwrapErr());
            }
            debug::LogHandshakeSent(config.role, round, payload.size(), outcome.message.size());
            ciphers = std::move(outcome.ciphers);
        } else if (!state.IsComplete()) {
            auto frame = transport.ReceiveFrame();
            if (frame.IsErr()) {
                return fail(std::move(frame).UnwrapErr());
            }
            const std::vector<uint8_t> message = std::move(frame).Unwrap();
            auto read = state.ReadMessage(message);
            if (read.IsErr()) {
                return fail(std::move(read).UnwrapErr());
            }
            noise::ReadOutcome outcome = std::move(read).Unwrap();
            debug::LogHandshakeReceived(config.role, round, message.size(), outcome.payload.size());
            if (consume) {
                consume(std::move(outcome.payload));
            }
            ciphers = std::move(outcome.ciphers);
        }

        if (ciphers.has_value()) {
            debug::LogHandshakeComplete(config.role, round + 1);
            return RunResult::Ok(HandshakeResult{std::move(*ciphers), state.HandshakeHash()});
        }
        if (state.IsComplete()) {
            return fail(ProtocolFailure::Handshake(
                "Handshake engine reported completion without transport cipher states"));
        }
    }
}

} // namespace seep::protocol::channel
