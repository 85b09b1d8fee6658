#include "output_broadcast.h"

namespace station {

OutputBroadcast::OutputBroadcast(SessionId session_id)
    : session_id_(std::move(session_id))
{
}

std::optional<uint64_t> OutputBroadcast::subscribe(ChunkHandler on_chunk, ExitHandler on_exit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_.load()) {
        return std::nullopt;
    }

    auto subscriber = std::make_shared<Subscriber>();
    subscriber->on_chunk = std::move(on_chunk);
    subscriber->on_exit = std::move(on_exit);

    uint64_t token = next_token_++;
    subscribers_[token] = std::move(subscriber);
    return token;
}

void OutputBroadcast::unsubscribe(uint64_t token) {
    std::shared_ptr<Subscriber> subscriber;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(token);
        if (it == subscribers_.end()) {
            return;
        }
        subscriber = std::move(it->second);
        subscribers_.erase(it);
    }
    subscriber->active.store(false);

    // Wait out a delivery in progress on another thread.
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
}

std::vector<std::shared_ptr<OutputBroadcast::Subscriber>> OutputBroadcast::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Subscriber>> result;
    result.reserve(subscribers_.size());
    for (const auto& [token, subscriber] : subscribers_) {
        (void)token;
        result.push_back(subscriber);
    }
    return result;
}

void OutputBroadcast::publish(const std::string& chunk) {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
    if (finished_.load()) return;

    OutputEvent event{session_id_, chunk};
    for (const auto& subscriber : snapshot()) {
        if (subscriber->active.load() && subscriber->on_chunk) {
            subscriber->on_chunk(event);
        }
    }
}

void OutputBroadcast::finish(int exit_code, bool closed) {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);

    std::vector<std::shared_ptr<Subscriber>> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_.exchange(true)) {
            return;
        }
        for (auto& [token, subscriber] : subscribers_) {
            (void)token;
            subscribers.push_back(std::move(subscriber));
        }
        subscribers_.clear();
    }

    ExitEvent event{session_id_, exit_code, closed};
    for (const auto& subscriber : subscribers) {
        if (subscriber->active.exchange(false) && subscriber->on_exit) {
            subscriber->on_exit(event);
        }
    }
}

size_t OutputBroadcast::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

Subscription::Subscription(std::weak_ptr<OutputBroadcast> broadcast, uint64_t token)
    : broadcast_(std::move(broadcast))
    , token_(token)
{
    if (auto locked = broadcast_.lock()) {
        session_id_ = locked->session_id();
    }
}

Subscription::~Subscription() {
    detach();
}

Subscription::Subscription(Subscription&& other) noexcept
    : broadcast_(std::move(other.broadcast_))
    , token_(other.token_)
    , session_id_(std::move(other.session_id_))
{
    other.token_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        detach();
        broadcast_ = std::move(other.broadcast_);
        token_ = other.token_;
        session_id_ = std::move(other.session_id_);
        other.token_ = 0;
    }
    return *this;
}

void Subscription::detach() {
    if (token_ == 0) return;

    if (auto broadcast = broadcast_.lock()) {
        broadcast->unsubscribe(token_);
    }
    broadcast_.reset();
    token_ = 0;
}

bool Subscription::attached() const {
    if (token_ == 0) return false;
    auto broadcast = broadcast_.lock();
    return broadcast && !broadcast->finished();
}

}
