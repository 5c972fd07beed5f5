// ProctorSFU - Exam Proctoring Media Server
// Signaling Handler - Request processing for the signaling surface
//
// Responsibilities:
// - Resolve the caller's peer and room, then run the engine operation
// - Re-validate registry state after every engine completion
// - Coalesce concurrent joins of an unseen room onto one router
// - Fan out producer announcements to permitted viewers
// - Trigger recording for student producers
// - Release everything a peer owns on disconnect

#ifndef PROCTORSFU_SIGNALING_SIGNALING_HANDLER_HPP
#define PROCTORSFU_SIGNALING_SIGNALING_HANDLER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "proctorsfu/core/structured_logger.hpp"
#include "proctorsfu/engine/media_engine_adapter.hpp"
#include "proctorsfu/recording/recording_orchestrator.hpp"
#include "proctorsfu/session/access_policy.hpp"
#include "proctorsfu/session/session_registry.hpp"
#include "proctorsfu/signaling/signaling_types.hpp"

namespace proctorsfu {
namespace signaling {

// =============================================================================
// Signaling Handler Interface
// =============================================================================

/**
 * @brief One method per signaling event.
 *
 * Every request method settles its reply exactly once, possibly after
 * asynchronous engine work. Errors are reported through the reply and never
 * close the connection.
 */
class ISignalingHandler {
public:
    virtual ~ISignalingHandler() = default;

    /**
     * @brief Join or re-join a room, creating it with a new router if unseen.
     *
     * Replies with the router capabilities, then pushes existing-producers.
     */
    virtual void joinRoom(const ClientContext& client, const JoinRoomRequest& request,
                          Reply<JoinRoomReply> reply) = 0;

    virtual void createTransport(const ClientContext& client, const CreateTransportRequest& request,
                                 Reply<TransportReply> reply) = 0;

    virtual void connectTransport(const ClientContext& client, const ConnectTransportRequest& request,
                                  Reply<Ack> reply) = 0;

    /**
     * @brief Publish a track. Viewers are told after the producer is registered.
     */
    virtual void produce(const ClientContext& client, const ProduceRequest& request,
                         Reply<ProduceReply> reply) = 0;

    /**
     * @brief Subscribe to a producer, creating a recv transport if needed.
     */
    virtual void consume(const ClientContext& client, const ConsumeRequest& request,
                         Reply<ConsumeReply> reply) = 0;

    /**
     * @brief Re-send the existing-producers snapshot.
     */
    virtual void getProducers(const ClientContext& client, Reply<Ack> reply) = 0;

    virtual void closeProducer(const ClientContext& client, const CloseProducerRequest& request,
                               Reply<Ack> reply) = 0;

    /**
     * @brief The connection is gone. Safe to call for connections that never joined.
     */
    virtual void disconnect(ConnectionId connectionId) = 0;
};

// =============================================================================
// Signaling Handler Implementation
// =============================================================================

/**
 * @brief ISignalingHandler over the session fabric.
 *
 * Runs on the executor thread together with the adapter and orchestrator.
 */
class SignalingHandler : public ISignalingHandler {
public:
    SignalingHandler(
        session::ISessionRegistry& registry,
        engine::MediaEngineAdapter& engine,
        const session::AccessPolicy& policy,
        recording::RecordingOrchestrator& recorder,
        INotifier& notifier,
        std::shared_ptr<core::StructuredLogger> logger
    );
    ~SignalingHandler() override;

    SignalingHandler(const SignalingHandler&) = delete;
    SignalingHandler& operator=(const SignalingHandler&) = delete;

    void joinRoom(const ClientContext& client, const JoinRoomRequest& request,
                  Reply<JoinRoomReply> reply) override;
    void createTransport(const ClientContext& client, const CreateTransportRequest& request,
                         Reply<TransportReply> reply) override;
    void connectTransport(const ClientContext& client, const ConnectTransportRequest& request,
                          Reply<Ack> reply) override;
    void produce(const ClientContext& client, const ProduceRequest& request,
                 Reply<ProduceReply> reply) override;
    void consume(const ClientContext& client, const ConsumeRequest& request,
                 Reply<ConsumeReply> reply) override;
    void getProducers(const ClientContext& client, Reply<Ack> reply) override;
    void closeProducer(const ClientContext& client, const CloseProducerRequest& request,
                       Reply<Ack> reply) override;
    void disconnect(ConnectionId connectionId) override;

    /**
     * @brief Joins waiting for a router to be created.
     */
    size_t pendingRoomCount() const { return pendingRooms_.size(); }

private:
    struct PendingJoin {
        ClientContext client;
        JoinRoomRequest request;
        Reply<JoinRoomReply> reply;
    };

    void onRouterCreated(const core::RoomId& roomId,
                         core::Result<core::RouterId, core::Error> result);
    void completeJoin(const ClientContext& client, const JoinRoomRequest& request,
                      const core::RouterId& routerId, const Reply<JoinRoomReply>& reply);

    void consumeOn(const ClientContext& client, const ConsumeRequest& request,
                   const core::RouterId& routerId, const core::TransportId& transportId,
                   Reply<ConsumeReply> reply);

    /**
     * @brief Close the engine side of a departed peer and tell its viewers.
     */
    void releasePeer(const session::LeaveOutcome& outcome);

    void releaseProducer(const session::ProducerRemoval& removal, const session::PeerInfo& owner);

    void pushExistingProducers(const session::PeerInfo& peer);
    void announceProducer(const session::PeerInfo& owner, const session::ProducerInfo& producer);

    void onRegistryEvent(const session::SessionEvent& event);

    session::ISessionRegistry& registry_;
    engine::MediaEngineAdapter& engine_;
    const session::AccessPolicy& policy_;
    recording::RecordingOrchestrator& recorder_;
    INotifier& notifier_;
    std::shared_ptr<core::StructuredLogger> logger_;

    std::unordered_map<core::RoomId, std::vector<PendingJoin>> pendingRooms_;
    std::unordered_multiset<ConnectionId> joining_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace signaling
} // namespace proctorsfu

#endif // PROCTORSFU_SIGNALING_SIGNALING_HANDLER_HPP
