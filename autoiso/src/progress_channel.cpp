#include "autoiso/progress_channel.hpp"

#include <algorithm>    // for erase
#include <string_view>  // for string_view

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

using namespace std::string_view_literals;

namespace autoiso::progress {

auto event_kind_to_string(EventKind kind) noexcept -> std::string_view {
    switch (kind) {
    case EventKind::Progress:
        return "progress"sv;
    case EventKind::Status:
        return "status"sv;
    case EventKind::Error:
        return "error"sv;
    }
    return "unknown"sv;
}

auto event_to_json(const ProgressEvent& event) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    const auto write_string = [&writer](std::string_view str) {
        writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
    };

    writer.StartObject();
    writer.Key("data");
    writer.StartObject();
    writer.Key("jobId");
    write_string(event.job_id);
    writer.Key("type");
    write_string(event_kind_to_string(event.kind));
    writer.Key("progress");
    writer.Uint(event.progress);
    writer.Key("status");
    write_string(event.status);
    writer.Key("message");
    write_string(event.message);
    writer.EndObject();
    writer.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
}

Subscription::~Subscription() {
    if (m_channel && m_queue) {
        m_channel->unsubscribe(m_queue);
    }
}

auto Subscription::operator=(Subscription&& other) noexcept -> Subscription& {
    if (this != &other) {
        if (m_channel && m_queue) {
            m_channel->unsubscribe(m_queue);
        }
        m_channel = std::move(other.m_channel);
        m_queue   = std::move(other.m_queue);
    }
    return *this;
}

auto Subscription::receive() noexcept -> std::optional<ProgressEvent> {
    if (!m_channel) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(m_channel->m_mutex);
    m_channel->m_cv.wait(lock, [this] { return !m_queue->events.empty() || m_queue->closed; });
    if (m_queue->events.empty()) {
        return std::nullopt;
    }
    auto event = std::move(m_queue->events.front());
    m_queue->events.pop_front();
    return event;
}

auto Subscription::receive_for(std::chrono::milliseconds timeout) noexcept -> std::optional<ProgressEvent> {
    if (!m_channel) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(m_channel->m_mutex);
    const bool ready = m_channel->m_cv.wait_for(lock, timeout, [this] { return !m_queue->events.empty() || m_queue->closed; });
    if (!ready || m_queue->events.empty()) {
        return std::nullopt;
    }
    auto event = std::move(m_queue->events.front());
    m_queue->events.pop_front();
    return event;
}

auto Subscription::finished() const noexcept -> bool {
    if (!m_channel) {
        return true;
    }
    const std::lock_guard<std::mutex> lock(m_channel->m_mutex);
    return m_queue->closed && m_queue->events.empty();
}

auto ProgressChannel::create() noexcept -> std::shared_ptr<ProgressChannel> {
    return std::shared_ptr<ProgressChannel>(new ProgressChannel());
}

auto ProgressChannel::subscribe() noexcept -> Subscription {
    auto queue = std::make_shared<Subscription::Queue>();
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            if (m_last_event.has_value()) {
                queue->events.push_back(*m_last_event);
            }
            queue->closed = true;
        } else {
            m_subscribers.push_back(queue);
        }
    }
    return Subscription{shared_from_this(), std::move(queue)};
}

auto ProgressChannel::publish(ProgressEvent event) noexcept -> bool {
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return false;
        }
        for (const auto& subscriber : m_subscribers) {
            subscriber->events.push_back(event);
        }
        m_last_event = std::move(event);
    }
    m_cv.notify_all();
    return true;
}

auto ProgressChannel::close(ProgressEvent final_event) noexcept -> bool {
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return false;
        }
        for (const auto& subscriber : m_subscribers) {
            subscriber->events.push_back(final_event);
            subscriber->closed = true;
        }
        m_subscribers.clear();
        m_last_event = std::move(final_event);
        m_closed     = true;
    }
    m_cv.notify_all();
    return true;
}

auto ProgressChannel::is_closed() const noexcept -> bool {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

auto ProgressChannel::subscriber_count() const noexcept -> std::size_t {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscribers.size();
}

void ProgressChannel::unsubscribe(const std::shared_ptr<Subscription::Queue>& queue) noexcept {
    const std::lock_guard<std::mutex> lock(m_mutex);
    std::erase(m_subscribers, queue);
}

auto ProgressHub::channel(std::string_view job_id) noexcept -> std::shared_ptr<ProgressChannel> {
    const std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_channels.find(job_id);
    if (it == m_channels.end()) {
        it = m_channels.emplace(std::string{job_id}, ProgressChannel::create()).first;
    }
    return it->second;
}

auto ProgressHub::find(std::string_view job_id) const noexcept -> std::shared_ptr<ProgressChannel> {
    const std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_channels.find(job_id);
    if (it == m_channels.end()) {
        return nullptr;
    }
    return it->second;
}

void ProgressHub::remove(std::string_view job_id) noexcept {
    const std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_channels.find(job_id);
    if (it != m_channels.end()) {
        m_channels.erase(it);
    }
}

auto ProgressHub::size() const noexcept -> std::size_t {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels.size();
}

}  // namespace autoiso::progress
