#pragma once

#include "core/session_events.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace station {

using ChunkHandler = std::function<void(const OutputEvent& event)>;
using ExitHandler = std::function<void(const ExitEvent& event)>;

// Fan-out of one session's output. Every subscriber sees every chunk published
// after it subscribed, in publish order, and exactly one exit event.
class OutputBroadcast {
public:
    explicit OutputBroadcast(SessionId session_id);

    OutputBroadcast(const OutputBroadcast&) = delete;
    OutputBroadcast& operator=(const OutputBroadcast&) = delete;

    // nullopt once the exit event has gone out.
    std::optional<uint64_t> subscribe(ChunkHandler on_chunk, ExitHandler on_exit);

    // When this returns, the subscriber will not be called again, unless it is
    // being called right now on this thread.
    void unsubscribe(uint64_t token);

    void publish(const std::string& chunk);
    void finish(int exit_code, bool closed);

    bool finished() const { return finished_.load(); }
    size_t subscriber_count() const;
    const SessionId& session_id() const { return session_id_; }

private:
    struct Subscriber {
        ChunkHandler on_chunk;
        ExitHandler on_exit;
        std::atomic<bool> active{true};
    };

    std::vector<std::shared_ptr<Subscriber>> snapshot() const;

    SessionId session_id_;

    mutable std::mutex mutex_;
    std::map<uint64_t, std::shared_ptr<Subscriber>> subscribers_;
    uint64_t next_token_ = 1;

    // Held for the whole of a delivery; recursive so handlers may unsubscribe.
    std::recursive_mutex delivery_mutex_;
    std::atomic<bool> finished_{false};
};

// Move-only handle for one attachment. Destroying it detaches.
class Subscription {
public:
    Subscription() = default;
    Subscription(std::weak_ptr<OutputBroadcast> broadcast, uint64_t token);
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void detach();

    // False after detach() or once the session is gone.
    bool attached() const;
    const SessionId& session_id() const { return session_id_; }

private:
    std::weak_ptr<OutputBroadcast> broadcast_;
    uint64_t token_ = 0;
    SessionId session_id_;
};

}
