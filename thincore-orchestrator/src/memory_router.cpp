/**
 * @file memory_router.cpp
 * @brief In-process task router implementation
 */

#include "memory_router.hpp"
#include "errors.hpp"
#include <algorithm>

namespace thincore {

namespace {

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool handles(const std::vector<std::string>& task_types, const std::string& task_type) {
    return std::find(task_types.begin(), task_types.end(), task_type) != task_types.end();
}

} // namespace

MemoryTaskRouter::MemoryTaskRouter(const RouterConfig& config, Logger* logger)
    : config_(config)
    , logger_(logger ? logger : &Logger::get_instance())
    , next_message_id_(1)
    , next_delivery_(1)
    , deliveries_(0)
{
    if (config_.max_attempts < 1) {
        throw ConfigurationError("max_attempts must be at least 1");
    }
    if (config_.lease_timeout.count() <= 0) {
        throw ConfigurationError("lease_timeout must be positive");
    }
}

std::string MemoryTaskRouter::make_token(const std::string& group, uint64_t message_id, uint64_t delivery) {
    return group + "|" + std::to_string(message_id) + "|" + std::to_string(delivery);
}

MemoryTaskRouter::Lease MemoryTaskRouter::parse_token(const std::string& token) {
    // Group names may contain '|', so split from the right
    size_t second = token.rfind('|');
    size_t first = second == std::string::npos || second == 0 ? std::string::npos : token.rfind('|', second - 1);
    if (first == std::string::npos) {
        throw IntegrityError("Malformed lease token '" + token + "'");
    }

    Lease lease;
    lease.group = token.substr(0, first);
    try {
        lease.message_id = std::stoull(token.substr(first + 1, second - first - 1));
        lease.delivery = std::stoull(token.substr(second + 1));
    } catch (const std::logic_error&) {
        throw IntegrityError("Malformed lease token '" + token + "'");
    }
    return lease;
}

void MemoryTaskRouter::enqueue(const TaskEnvelope& envelope) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Message message;
        message.id = next_message_id_++;
        message.envelope = envelope;
        message.envelope.lease_token.clear();
        queues_[envelope.task_type].push_back(std::move(message));
    }
    queue_cv_.notify_all();
}

TaskEnvelope MemoryTaskRouter::deliver(
    Pending& pending,
    const std::string& group,
    const std::string& worker_id,
    int attempt
) {
    pending.consumer = worker_id;
    pending.delivery = next_delivery_++;
    pending.attempt = attempt;
    pending.deadline = Clock::now() + config_.lease_timeout;
    deliveries_++;

    TaskEnvelope envelope = pending.message.envelope;
    envelope.attempt = attempt;
    envelope.lease_token = make_token(group, pending.message.id, pending.delivery);
    return envelope;
}

std::optional<TaskEnvelope> MemoryTaskRouter::take_over_expired(
    Group& group,
    const std::string& group_name,
    const std::string& worker_id,
    const std::vector<std::string>& task_types
) {
    auto now = Clock::now();
    for (auto it = group.pending.begin(); it != group.pending.end();) {
        Pending& pending = it->second;
        if (pending.deadline > now || !handles(task_types, pending.message.envelope.task_type)) {
            ++it;
            continue;
        }

        int attempt = pending.attempt + 1;
        if (attempt >= config_.max_attempts) {
            TaskEnvelope envelope = pending.message.envelope;
            envelope.attempt = pending.attempt;
            std::string reason = "lease expired on final attempt " + std::to_string(pending.attempt + 1) +
                                 " of " + std::to_string(config_.max_attempts);
            it = group.pending.erase(it);
            push_dead_letter(envelope, CompletionStatus::FAILED, reason);

            LogContext ctx(envelope.run_id, envelope.task_key, envelope.task_type);
            ctx.worker_id = worker_id;
            ctx.phase = "route";
            logger_->log_task_dead_lettered(ctx, "failed", reason);
            continue;
        }

        return deliver(pending, group_name, worker_id, attempt);
    }
    return std::nullopt;
}

std::optional<TaskEnvelope> MemoryTaskRouter::deliver_new(
    Group& group,
    const std::string& group_name,
    const std::string& worker_id,
    const std::vector<std::string>& task_types
) {
    // Oldest undelivered message across the requested types
    std::vector<Message>* best_queue = nullptr;
    size_t best_index = 0;
    std::string best_type;

    for (const auto& task_type : task_types) {
        auto queue_it = queues_.find(task_type);
        if (queue_it == queues_.end()) {
            continue;
        }
        size_t index = group.next_index[task_type];
        if (index >= queue_it->second.size()) {
            continue;
        }
        if (!best_queue || queue_it->second[index].id < (*best_queue)[best_index].id) {
            best_queue = &queue_it->second;
            best_index = index;
            best_type = task_type;
        }
    }

    if (!best_queue) {
        return std::nullopt;
    }

    group.next_index[best_type] = best_index + 1;
    const Message& message = (*best_queue)[best_index];

    Pending pending;
    pending.message = message;
    auto inserted = group.pending.emplace(message.id, std::move(pending));
    return deliver(inserted.first->second, group_name, worker_id, message.envelope.attempt);
}

std::optional<TaskEnvelope> MemoryTaskRouter::claim(
    const std::string& consumer_group,
    const std::string& worker_id,
    const std::vector<std::string>& task_types,
    std::chrono::milliseconds block_timeout
) {
    if (task_types.empty()) {
        throw ConfigurationError("claim requires at least one task type");
    }

    auto deadline = Clock::now() + block_timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    Group& group = groups_[consumer_group];

    while (true) {
        auto taken = take_over_expired(group, consumer_group, worker_id, task_types);
        if (taken) {
            return taken;
        }

        auto fresh = deliver_new(group, consumer_group, worker_id, task_types);
        if (fresh) {
            return fresh;
        }

        auto now = Clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }

        // Wake for new messages, or when the earliest lease we could take over expires
        auto wake = deadline;
        for (const auto& [id, pending] : group.pending) {
            if (handles(task_types, pending.message.envelope.task_type)) {
                wake = std::min(wake, pending.deadline);
            }
        }
        queue_cv_.wait_until(lock, std::max(wake, now + std::chrono::milliseconds(1)));
    }
}

MemoryTaskRouter::Pending* MemoryTaskRouter::find_owned(const Lease& lease) {
    auto group_it = groups_.find(lease.group);
    if (group_it == groups_.end()) {
        return nullptr;
    }
    auto pending_it = group_it->second.pending.find(lease.message_id);
    if (pending_it == group_it->second.pending.end() || pending_it->second.delivery != lease.delivery) {
        return nullptr;
    }
    return &pending_it->second;
}

bool MemoryTaskRouter::ack(const TaskEnvelope& envelope, const TaskOutcome& outcome) {
    Lease lease = parse_token(envelope.lease_token);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!find_owned(lease)) {
            return false;
        }
        groups_[lease.group].pending.erase(lease.message_id);
        publish(make_done_event(envelope, outcome));
    }
    queue_cv_.notify_all();
    return true;
}

NackResult MemoryTaskRouter::nack(const TaskEnvelope& envelope, const std::string& reason) {
    Lease lease = parse_token(envelope.lease_token);
    NackResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Pending* pending = find_owned(lease);
        if (!pending) {
            return NackResult::STALE;
        }

        TaskEnvelope retry = pending->message.envelope;
        retry.attempt = pending->attempt + 1;
        groups_[lease.group].pending.erase(lease.message_id);

        if (retry.attempt >= config_.max_attempts) {
            TaskEnvelope final_delivery = envelope;
            final_delivery.attempt = retry.attempt - 1;
            push_dead_letter(final_delivery, CompletionStatus::FAILED, reason);
            result = NackResult::DEAD_LETTERED;
        } else {
            Message message;
            message.id = next_message_id_++;
            message.envelope = retry;
            queues_[retry.task_type].push_back(std::move(message));
            result = NackResult::REQUEUED;
        }
    }
    queue_cv_.notify_all();
    return result;
}

bool MemoryTaskRouter::dead_letter(
    const TaskEnvelope& envelope,
    CompletionStatus status,
    const std::string& reason
) {
    Lease lease = parse_token(envelope.lease_token);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!find_owned(lease)) {
            return false;
        }
        groups_[lease.group].pending.erase(lease.message_id);
        push_dead_letter(envelope, status, reason);
    }
    queue_cv_.notify_all();
    return true;
}

void MemoryTaskRouter::push_dead_letter(
    const TaskEnvelope& envelope,
    CompletionStatus status,
    const std::string& reason
) {
    DeadLetterEntry entry;
    entry.envelope = envelope;
    entry.envelope.lease_token.clear();
    entry.status = status;
    entry.reason = reason;
    entry.dead_lettered_at_ms = now_epoch_ms();
    dead_letters_[envelope.task_type].push_back(entry);
    publish(make_terminal_event(envelope, status, reason));
}

void MemoryTaskRouter::publish(const CompletionEvent& event) {
    events_[event.run_id].push_back(event);
    events_cv_.notify_all();
}

std::string MemoryTaskRouter::completion_cursor(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = events_.find(run_id);
    return std::to_string(it == events_.end() ? 0 : it->second.size());
}

std::vector<CompletionEvent> MemoryTaskRouter::poll_completions(
    const std::string& run_id,
    std::string& cursor,
    std::chrono::milliseconds timeout
) {
    size_t position = 0;
    try {
        position = cursor.empty() ? 0 : std::stoull(cursor);
    } catch (const std::logic_error&) {
        throw IntegrityError("Malformed completion cursor '" + cursor + "'");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    events_cv_.wait_for(lock, timeout, [&]() {
        auto it = events_.find(run_id);
        return it != events_.end() && it->second.size() > position;
    });

    std::vector<CompletionEvent> result;
    auto it = events_.find(run_id);
    if (it != events_.end()) {
        for (size_t i = position; i < it->second.size(); ++i) {
            result.push_back(it->second[i]);
        }
        cursor = std::to_string(it->second.size());
    }
    return result;
}

std::vector<DeadLetterEntry> MemoryTaskRouter::dead_letters(const std::string& task_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = dead_letters_.find(task_type);
    if (it == dead_letters_.end()) {
        return {};
    }
    return it->second;
}

size_t MemoryTaskRouter::queue_depth(const std::string& task_type, const std::string& consumer_group) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto queue_it = queues_.find(task_type);
    size_t total = queue_it == queues_.end() ? 0 : queue_it->second.size();

    auto group_it = groups_.find(consumer_group);
    if (group_it == groups_.end()) {
        return total;
    }

    const Group& group = group_it->second;
    auto index_it = group.next_index.find(task_type);
    size_t delivered = index_it == group.next_index.end() ? 0 : index_it->second;

    size_t pending = 0;
    for (const auto& [id, entry] : group.pending) {
        if (entry.message.envelope.task_type == task_type) {
            pending++;
        }
    }
    return (total - delivered) + pending;
}

void MemoryTaskRouter::expire_leases() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        for (auto& [name, group] : groups_) {
            for (auto& [id, pending] : group.pending) {
                pending.deadline = now;
            }
        }
    }
    queue_cv_.notify_all();
}

size_t MemoryTaskRouter::delivery_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveries_;
}

} // namespace thincore
