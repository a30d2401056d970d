/**
 * @file group_coordinator.cpp
 * @brief Round-robin partition assignment and ownership queries
 */

#include "streamiq/cluster/group_coordinator.hpp"

#include <stdexcept>

#include "streamiq/cluster/partitioner.hpp"
#include "streamiq/logging.hpp"

namespace streamiq {

GroupCoordinator::GroupCoordinator(std::string application_id, int num_partitions)
    : application_id_(std::move(application_id))
    , num_partitions_(num_partitions) {
    if (num_partitions_ < 1) {
        throw std::invalid_argument("num_partitions must be positive");
    }
}

void GroupCoordinator::join(GroupMember member) {
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto id = member.member_id;
        if (members_.count(id) > 0) {
            throw std::invalid_argument("Member '" + id + "' already joined group '"
                + application_id_ + "'");
        }
        members_.emplace(id, Member{std::move(member), {}});
        notifications = rebalance();
        STREAMIQ_INFO("member {} joined group {} (generation {}, {} member(s))",
            id, application_id_, generation_, members_.size());
    }
    notify(notifications);
}

void GroupCoordinator::leave(const std::string& member_id) {
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (members_.erase(member_id) == 0) {
            return;
        }
        notifications = rebalance();
        STREAMIQ_INFO("member {} left group {} (generation {}, {} member(s))",
            member_id, application_id_, generation_, members_.size());
    }
    notify(notifications);
}

std::vector<GroupCoordinator::Notification> GroupCoordinator::rebalance() {
    generation_++;

    for (auto& [id, member] : members_) {
        member.partitions.clear();
    }

    if (!members_.empty()) {
        auto it = members_.begin();
        for (int partition = 0; partition < num_partitions_; partition++) {
            it->second.partitions.insert(partition);
            if (++it == members_.end()) {
                it = members_.begin();
            }
        }
    }

    std::vector<Notification> notifications;
    for (const auto& [id, member] : members_) {
        if (member.info.on_assignment) {
            notifications.push_back({member.info.on_assignment, generation_, member.partitions});
        }
    }
    return notifications;
}

void GroupCoordinator::notify(const std::vector<Notification>& notifications) {
    for (const auto& notification : notifications) {
        notification.callback(notification.generation, notification.partitions);
    }
}

std::optional<StreamsMetadata> GroupCoordinator::metadata_for_key(
    const std::string& store_name,
    const Bytes& serialized_key
) const {
    const int partition = partition_for(serialized_key, num_partitions_);

    std::lock_guard<std::mutex> lock(mutex_);
    const Member* fallback = nullptr;
    for (const auto& [id, member] : members_) {
        if (member.info.store_names.count(store_name) == 0) {
            continue;
        }
        if (member.partitions.count(partition) > 0) {
            return to_metadata(member);
        }
        if (!fallback) {
            fallback = &member;
        }
    }
    if (fallback) {
        return to_metadata(*fallback);
    }
    return std::nullopt;
}

std::vector<StreamsMetadata> GroupCoordinator::all_metadata() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StreamsMetadata> result;
    result.reserve(members_.size());
    for (const auto& [id, member] : members_) {
        result.push_back(to_metadata(member));
    }
    return result;
}

std::vector<StreamsMetadata> GroupCoordinator::all_metadata_for_store(const std::string& store_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StreamsMetadata> result;
    for (const auto& [id, member] : members_) {
        if (member.info.store_names.count(store_name) > 0) {
            result.push_back(to_metadata(member));
        }
    }
    return result;
}

std::uint64_t GroupCoordinator::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

std::size_t GroupCoordinator::member_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.size();
}

StreamsMetadata GroupCoordinator::to_metadata(const Member& member) {
    return {member.info.host_info, member.info.store_names, member.partitions};
}

} // namespace streamiq
