/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#include "SignalingCodec.h"
#include "src/Calling/Protocol/signaling.capnp.h"

#include <capnp/message.h>
#include <capnp/serialize.h>

#include <cstring>
#include <string>

namespace EntropyEngine::Calling
{

namespace wire = entropy::calling;

namespace {

capnp::Text::Reader text(const std::string& s) {
    return capnp::Text::Reader(s.data(), s.size());
}

capnp::Text::Reader text(const std::optional<std::string>& s) {
    return s ? capnp::Text::Reader(s->data(), s->size()) : capnp::Text::Reader("");
}

std::string str(capnp::Text::Reader t) {
    return std::string(t.cStr(), t.size());
}

std::optional<std::string> optStr(capnp::Text::Reader t) {
    if (t.size() == 0) {
        return std::nullopt;
    }
    return str(t);
}

// Event writers, one per SignalEvent alternative

void write(wire::Envelope::Builder env, const CallInitiate& e) {
    env.initCallInitiate().setTo(text(e.to));
}

void write(wire::Envelope::Builder env, const CallAccept& e) {
    env.initCallAccept().setCallId(text(e.callId));
}

void write(wire::Envelope::Builder env, const CallDecline& e) {
    env.initCallDecline().setCallId(text(e.callId));
}

void write(wire::Envelope::Builder env, const CallCancel& e) {
    auto b = env.initCallCancel();
    b.setCallId(text(e.callId));
    b.setFrom(text(e.from));
}

void write(wire::Envelope::Builder env, const CallEnd& e) {
    auto b = env.initCallEnd();
    b.setCallId(text(e.callId));
    b.setRoomId(text(e.roomId));
}

void write(wire::Envelope::Builder env, const CallIncoming& e) {
    auto b = env.initCallIncoming();
    b.setCallId(text(e.callId));
    b.setFrom(text(e.from));
    b.setFromNick(text(e.fromNick));
}

void write(wire::Envelope::Builder env, const CallAccepted& e) {
    auto b = env.initCallAccepted();
    b.setCallId(text(e.callId));
    b.setFrom(text(e.from));
    b.setRoomId(text(e.roomId));
}

void write(wire::Envelope::Builder env, const CallDeclined& e) {
    auto b = env.initCallDeclined();
    b.setCallId(text(e.callId));
    b.setFrom(text(e.from));
}

void write(wire::Envelope::Builder env, const CallTimeout& e) {
    env.initCallTimeout().setCallId(text(e.callId));
}

void write(wire::Envelope::Builder env, const CallBusy& e) {
    env.initCallBusy().setPeer(text(e.from));
}

void write(wire::Envelope::Builder env, const CallRoomFull& e) {
    env.initCallRoomFull().setPeer(text(e.userId));
}

void write(wire::Envelope::Builder env, const CallEnded& e) {
    auto b = env.initCallEnded();
    b.setCallId(text(e.callId));
    b.setRoomId(text(e.roomId));
}

void write(wire::Envelope::Builder env, const SdpOffer& e) {
    auto b = env.initOffer();
    b.setPeer(text(e.peer));
    b.setSdp(text(e.sdp));
    b.setRoomId(text(e.roomId));
}

void write(wire::Envelope::Builder env, const SdpAnswer& e) {
    auto b = env.initAnswer();
    b.setPeer(text(e.peer));
    b.setSdp(text(e.sdp));
    b.setRoomId(text(e.roomId));
}

void write(wire::Envelope::Builder env, const IceCandidateSignal& e) {
    auto b = env.initIceCandidate();
    b.setPeer(text(e.peer));
    b.setCandidate(text(e.candidate));
    b.setMid(text(e.mid));
    b.setRoomId(text(e.roomId));
}

void write(wire::Envelope::Builder env, const CamToggle& e) {
    auto b = env.initCamToggle();
    b.setRoomId(text(e.roomId));
    b.setEnabled(e.enabled);
    b.setFrom(text(e.from));
}

void write(wire::Envelope::Builder env, const PipState& e) {
    auto b = env.initPipState();
    b.setRoomId(text(e.roomId));
    b.setEnabled(e.inPiP);
    b.setFrom(text(e.from));
}

void write(wire::Envelope::Builder env, const IdentityAttach& e) {
    auto b = env.initIdentityAttach();
    b.setInstallId(text(e.installId));
    b.setNick(text(e.nick));
    b.setAvatarUrl(text(e.avatarUrl));
}

void write(wire::Envelope::Builder env, const Reauth& e) {
    env.initReauth().setUserId(text(e.userId));
}

void write(wire::Envelope::Builder env, const PresenceUpdate& e) {
    auto b = env.initPresenceUpdate();
    b.setStatus(text(e.status));
    b.setRoomId(text(e.roomId));
}

void write(wire::Envelope::Builder env, const MatchStart&) {
    env.setMatchStart();
}

void write(wire::Envelope::Builder env, const MatchNext&) {
    env.setMatchNext();
}

void write(wire::Envelope::Builder env, const MatchStop&) {
    env.setMatchStop();
}

void write(wire::Envelope::Builder env, const MatchFound& e) {
    auto b = env.initMatchFound();
    b.setRoomId(text(e.roomId));
    b.setPartnerId(text(e.partnerId));
    b.setUserId(text(e.userId));
    b.setOfferer(e.offerer);
}

void write(wire::Envelope::Builder env, const PeerLeft& e) {
    env.initPeerLeft().setPeer(text(e.peer));
}

void write(wire::Envelope::Builder env, const PeerStopped& e) {
    env.initPeerStopped().setPeer(text(e.peer));
}

void write(wire::Envelope::Builder env, const Ack& ack) {
    auto b = env.initAck();
    b.setOk(ack.ok);
    b.setCallId(text(ack.callId));
    b.setUserId(text(ack.userId));
    b.setError(text(ack.error));
}

Result<SignalEnvelope> readEnvelope(wire::Envelope::Reader env) {
    SignalEnvelope out;
    out.requestId = env.getRequestId();

    switch (env.which()) {
        case wire::Envelope::ACK: {
            auto r = env.getAck();
            Ack ack;
            ack.ok = r.getOk();
            ack.callId = optStr(r.getCallId());
            ack.userId = optStr(r.getUserId());
            ack.error = optStr(r.getError());
            out.body = std::move(ack);
            break;
        }
        case wire::Envelope::CALL_INITIATE:
            out.body = SignalEvent{CallInitiate{str(env.getCallInitiate().getTo())}};
            break;
        case wire::Envelope::CALL_ACCEPT:
            out.body = SignalEvent{CallAccept{str(env.getCallAccept().getCallId())}};
            break;
        case wire::Envelope::CALL_DECLINE:
            out.body = SignalEvent{CallDecline{str(env.getCallDecline().getCallId())}};
            break;
        case wire::Envelope::CALL_CANCEL: {
            auto r = env.getCallCancel();
            out.body = SignalEvent{CallCancel{str(r.getCallId()), optStr(r.getFrom())}};
            break;
        }
        case wire::Envelope::CALL_END: {
            auto r = env.getCallEnd();
            out.body = SignalEvent{CallEnd{str(r.getCallId()), str(r.getRoomId())}};
            break;
        }
        case wire::Envelope::CALL_INCOMING: {
            auto r = env.getCallIncoming();
            out.body = SignalEvent{CallIncoming{str(r.getCallId()), str(r.getFrom()), optStr(r.getFromNick())}};
            break;
        }
        case wire::Envelope::CALL_ACCEPTED: {
            auto r = env.getCallAccepted();
            out.body = SignalEvent{CallAccepted{str(r.getCallId()), str(r.getFrom()), optStr(r.getRoomId())}};
            break;
        }
        case wire::Envelope::CALL_DECLINED: {
            auto r = env.getCallDeclined();
            out.body = SignalEvent{CallDeclined{str(r.getCallId()), str(r.getFrom())}};
            break;
        }
        case wire::Envelope::CALL_TIMEOUT:
            out.body = SignalEvent{CallTimeout{str(env.getCallTimeout().getCallId())}};
            break;
        case wire::Envelope::CALL_BUSY:
            out.body = SignalEvent{CallBusy{str(env.getCallBusy().getPeer())}};
            break;
        case wire::Envelope::CALL_ROOM_FULL:
            out.body = SignalEvent{CallRoomFull{optStr(env.getCallRoomFull().getPeer())}};
            break;
        case wire::Envelope::CALL_ENDED: {
            auto r = env.getCallEnded();
            out.body = SignalEvent{CallEnded{str(r.getCallId()), str(r.getRoomId())}};
            break;
        }
        case wire::Envelope::OFFER: {
            auto r = env.getOffer();
            out.body = SignalEvent{SdpOffer{str(r.getPeer()), str(r.getSdp()), optStr(r.getRoomId())}};
            break;
        }
        case wire::Envelope::ANSWER: {
            auto r = env.getAnswer();
            out.body = SignalEvent{SdpAnswer{str(r.getPeer()), str(r.getSdp()), optStr(r.getRoomId())}};
            break;
        }
        case wire::Envelope::ICE_CANDIDATE: {
            auto r = env.getIceCandidate();
            out.body = SignalEvent{IceCandidateSignal{str(r.getPeer()), str(r.getCandidate()), str(r.getMid()),
                                                      optStr(r.getRoomId())}};
            break;
        }
        case wire::Envelope::CAM_TOGGLE: {
            auto r = env.getCamToggle();
            out.body = SignalEvent{CamToggle{str(r.getRoomId()), r.getEnabled(), optStr(r.getFrom())}};
            break;
        }
        case wire::Envelope::PIP_STATE: {
            auto r = env.getPipState();
            out.body = SignalEvent{PipState{str(r.getRoomId()), r.getEnabled(), optStr(r.getFrom())}};
            break;
        }
        case wire::Envelope::IDENTITY_ATTACH: {
            auto r = env.getIdentityAttach();
            out.body = SignalEvent{IdentityAttach{str(r.getInstallId()), optStr(r.getNick()), optStr(r.getAvatarUrl())}};
            break;
        }
        case wire::Envelope::REAUTH:
            out.body = SignalEvent{Reauth{str(env.getReauth().getUserId())}};
            break;
        case wire::Envelope::PRESENCE_UPDATE: {
            auto r = env.getPresenceUpdate();
            out.body = SignalEvent{PresenceUpdate{str(r.getStatus()), optStr(r.getRoomId())}};
            break;
        }
        case wire::Envelope::MATCH_START:
            out.body = SignalEvent{MatchStart{}};
            break;
        case wire::Envelope::MATCH_NEXT:
            out.body = SignalEvent{MatchNext{}};
            break;
        case wire::Envelope::MATCH_STOP:
            out.body = SignalEvent{MatchStop{}};
            break;
        case wire::Envelope::MATCH_FOUND: {
            auto r = env.getMatchFound();
            out.body = SignalEvent{MatchFound{str(r.getRoomId()), str(r.getPartnerId()), optStr(r.getUserId()),
                                              r.getOfferer()}};
            break;
        }
        case wire::Envelope::PEER_LEFT:
            out.body = SignalEvent{PeerLeft{optStr(env.getPeerLeft().getPeer())}};
            break;
        case wire::Envelope::PEER_STOPPED:
            out.body = SignalEvent{PeerStopped{optStr(env.getPeerStopped().getPeer())}};
            break;
        default:
            return Result<SignalEnvelope>::err(CallError::DeserializationFailed, "Unknown envelope variant");
    }

    return Result<SignalEnvelope>::ok(std::move(out));
}

} // namespace

Result<std::vector<uint8_t>> encodeEnvelope(const SignalEnvelope& envelope) {
    try {
        capnp::MallocMessageBuilder builder;
        auto env = builder.initRoot<wire::Envelope>();
        env.setRequestId(envelope.requestId);

        if (const auto* ack = std::get_if<Ack>(&envelope.body)) {
            write(env, *ack);
        } else {
            std::visit([&](const auto& event) { write(env, event); }, std::get<SignalEvent>(envelope.body));
        }

        auto flat = capnp::messageToFlatArray(builder);
        auto bytes = flat.asPtr().asBytes();
        return Result<std::vector<uint8_t>>::ok(std::vector<uint8_t>(bytes.begin(), bytes.end()));
    } catch (const std::exception& e) {
        return Result<std::vector<uint8_t>>::err(CallError::SerializationFailed,
                                                 std::string("Failed to encode envelope: ") + e.what());
    }
}

Result<SignalEnvelope> decodeEnvelope(const std::vector<uint8_t>& frame) {
    // Frames arrive unaligned; the reader needs whole words
    if (frame.empty() || frame.size() % sizeof(capnp::word) != 0) {
        return Result<SignalEnvelope>::err(CallError::DeserializationFailed,
                                           "Frame of " + std::to_string(frame.size()) + " bytes is not word aligned");
    }

    try {
        auto words = kj::heapArray<capnp::word>(frame.size() / sizeof(capnp::word));
        std::memcpy(words.begin(), frame.data(), frame.size());
        capnp::FlatArrayMessageReader reader(words.asPtr());
        return readEnvelope(reader.getRoot<wire::Envelope>());
    } catch (const std::exception& e) {
        return Result<SignalEnvelope>::err(CallError::DeserializationFailed,
                                           std::string("Failed to decode envelope: ") + e.what());
    }
}

}  // namespace EntropyEngine::Calling
