// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at https://mozilla.org/MPL/2.0/.

#include "../src/Calling/Core/EventLoop.h"
#include "../src/Calling/Core/KeyValueStore.h"
#include "../src/Calling/Signaling/WebSocketSignalingTransport.h"
#include "../src/Calling/Signaling/SignalingChannel.h"
#include "../src/Calling/Signaling/IdentityReattachment.h"
#include "../src/Calling/Media/RtcMediaTransport.h"
#include "../src/Calling/Session/MissedCallLedger.h"
#include "../src/Calling/Session/CallSessionManager.h"
#include "../src/Calling/Continuity/CallControlRegistry.h"
#include "../src/Calling/Continuity/ContinuityBridge.h"
#include <Logging/Logger.h>
#include <iostream>
#include <thread>
#include <chrono>
#include <sstream>
#include <string>
#include <format>

using namespace std;
using namespace EntropyEngine::Calling;

namespace {

// No camera or microphone here: tracks exist but nothing feeds them frames
class SilentCapture : public MediaCapture {
public:
    Result<shared_ptr<MediaStream>> openLocalStream(bool withVideo) override {
        auto stream = make_shared<MediaStream>(std::format("local-{}", ++_opened));
        stream->addTrack(make_shared<MediaTrack>("mic", TrackKind::Audio));
        if (withVideo) {
            stream->addTrack(make_shared<MediaTrack>("camera", TrackKind::Video));
        }
        return Result<shared_ptr<MediaStream>>::ok(stream);
    }

private:
    int _opened = 0;
};

class ConsoleObserver : public CallObserver {
public:
    void onCallStateChanged(const CallRecord& record) override {
        ENTROPY_LOG_INFO(std::format("Call {} with {} is {}", record.callId, record.peerId,
                                     callStateToString(record.state)));
    }

    void onIncomingCall(const CallRecord& record) override {
        ENTROPY_LOG_INFO(std::format("Incoming call from {} ({}), type 'accept' or 'decline'",
                                     record.peerNick.value_or(record.peerId), record.callId));
    }

    void onCallFailed(const CallRecord& record, CallError error, const string& message) override {
        ENTROPY_LOG_WARNING(std::format("Call with {} failed: {} {}", record.peerId, errorToString(error), message));
    }

    void onRemoteDisconnected(const CallRecord& record) override {
        ENTROPY_LOG_WARNING(std::format("Media to {} dropped, 'hangup' to give up", record.peerId));
    }

    void onRemoteCameraChanged(bool enabled) override {
        ENTROPY_LOG_INFO(enabled ? "Partner camera on" : "Partner camera off");
    }

    void onPartnerPipChanged(bool inPiP) override {
        ENTROPY_LOG_INFO(inPiP ? "Partner switched to picture-in-picture" : "Partner is back in the call");
    }

    void onMatchStateChanged(MatchState state, const optional<PeerId>& partner) override {
        ENTROPY_LOG_INFO(std::format("Matchmaking {}{}", matchStateToString(state),
                                     partner ? " with " + *partner : string()));
    }
};

void report(const char* what, const Result<void>& result) {
    if (result.failed()) {
        ENTROPY_LOG_WARNING(std::format("{}: {} {}", what, errorToString(result.error), result.errorMessage));
    }
}

void printUsage() {
    cout << "Commands: call <peer> | cancel | accept | decline | hangup | mic | cam | speaker\n"
            "          match | next | stop | pip | back | missed <peer> | quit" << endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        cerr << "Usage: " << argv[0] << " <relay-url> <install-id> [nick]" << endl;
        return 1;
    }

    try {
        SignalingConfig signalingConfig;
        signalingConfig.url = argv[1];
        const string installId = argv[2];
        IdentityReattachment::Profile profile;
        if (argc > 3) {
            profile.nick = string(argv[3]);
        }

        MediaTransportConfig mediaConfig;
        mediaConfig.iceServers.push_back("stun:stun.l.google.com:19302");

        EventLoop loop;
        loop.start();

        WebSocketSignalingTransport transport(signalingConfig, loop);
        SignalingChannel channel(transport, loop, signalingConfig);
        InMemoryKeyValueStore store;
        IdentityReattachment identity(channel, store);
        MissedCallLedger ledger(store, loop);
        RtcMediaTransportFactory transportFactory;
        SilentCapture capture;
        CallControlRegistry controls;
        ConsoleObserver observer;

        unique_ptr<CallSessionManager> manager;
        unique_ptr<ContinuityBridge> pip;

        ledger.setCountCallback([](const PeerId& peer, uint32_t count) {
            ENTROPY_LOG_INFO(std::format("{} missed call(s) from {}", count, peer));
        });

        loop.post([&]() {
            manager = make_unique<CallSessionManager>(channel, identity, ledger, transportFactory, capture, loop,
                                                      &controls, CallConfig{}, mediaConfig);
            manager->setObserver(&observer);
            pip = make_unique<ContinuityBridge>(controls, channel);
            pip->setExitCallback([]() { ENTROPY_LOG_INFO("Picture-in-picture closed"); });

            report("connect", channel.connect());
            identity.attach(installId, profile, [](Result<string> userId) {
                if (userId.success()) {
                    ENTROPY_LOG_INFO("Signed in as " + userId.value);
                } else {
                    ENTROPY_LOG_ERROR(std::format("Sign-in failed: {} {}", errorToString(userId.error),
                                                  userId.errorMessage));
                }
            });
        });

        printUsage();
        string line;
        while (getline(cin, line)) {
            istringstream words(line);
            string command, argument;
            words >> command >> argument;
            if (command.empty()) continue;
            if (command == "quit") break;

            // The call stack is single-threaded; every command runs on the loop
            loop.post([&, command, argument]() {
                if (!manager) return;
                if (command == "call") {
                    auto started = manager->initiateCall(argument, [](Result<CallId> callId) {
                        if (callId.success()) {
                            ENTROPY_LOG_INFO("Ringing, call id " + callId.value);
                        }
                    });
                    report("call", started);
                } else if (command == "cancel") {
                    report("cancel", manager->cancelCall());
                } else if (command == "accept") {
                    report("accept", manager->acceptCall());
                } else if (command == "decline") {
                    report("decline", manager->declineCall());
                } else if (command == "hangup") {
                    manager->hangup();
                } else if (command == "mic") {
                    auto mic = manager->toggleMic();
                    if (mic.success()) {
                        ENTROPY_LOG_INFO(mic.value ? "Mic on" : "Mic off");
                    }
                } else if (command == "cam") {
                    auto cam = manager->toggleCamera();
                    if (cam.success()) {
                        ENTROPY_LOG_INFO(cam.value ? "Camera on" : "Camera off");
                    } else {
                        ENTROPY_LOG_WARNING("cam: " + cam.errorMessage);
                    }
                } else if (command == "speaker") {
                    auto speaker = manager->toggleRemoteAudio();
                    if (speaker.success()) {
                        ENTROPY_LOG_INFO(speaker.value ? "Speaker on" : "Speaker off");
                    }
                } else if (command == "match") {
                    report("match", manager->startMatchmaking());
                } else if (command == "next") {
                    report("next", manager->nextMatch());
                } else if (command == "stop") {
                    report("stop", manager->stopMatchmaking());
                } else if (command == "pip") {
                    const auto& call = manager->currentCall();
                    PartnerMeta partner{call ? call->peerId : PeerId(), call ? call->peerNick : nullopt, nullopt};
                    vector<shared_ptr<MediaStream>> streams;
                    if (auto session = manager->session(SessionType::Direct)) {
                        streams = {session->localStream(), session->remoteStream()};
                    }
                    report("pip", pip->enter(std::move(partner), std::move(streams)));
                } else if (command == "back") {
                    report("back", pip->returnToCall());
                } else if (command == "missed") {
                    ENTROPY_LOG_INFO(std::format("{} missed call(s) from {}", ledger.count(argument), argument));
                } else {
                    printUsage();
                }
            });
        }

        // Tear the call stack down on its own thread before the loop stops
        loop.post([&]() {
            if (manager) manager->hangup();
            pip.reset();
            manager.reset();
            channel.disconnect();
        });
        this_thread::sleep_for(chrono::milliseconds(200));
        loop.stop();

        ENTROPY_LOG_INFO("Call client exiting");
        return 0;

    } catch (const exception& e) {
        ENTROPY_LOG_ERROR(std::format("Fatal error: {}", e.what()));
        return 1;
    }
}
