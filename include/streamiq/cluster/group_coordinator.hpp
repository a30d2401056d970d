#pragma once

/**
 * @file group_coordinator.hpp
 * @brief In-process group membership and partition assignment
 */

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "streamiq/cluster/host_info.hpp"
#include "streamiq/core/record.hpp"

namespace streamiq {

using AssignmentCallback = std::function<void(std::uint64_t generation, const std::set<int>& partitions)>;

/**
 * @brief Partitions a member owns, tagged with the generation that assigned them
 *
 * Callbacks from concurrent joins and leaves may arrive out of order;
 * update() keeps only the newest generation seen.
 */
class Assignment {
public:
    /**
     * @return false if generation is not newer than the current one
     */
    bool update(std::uint64_t generation, std::set<int> partitions) {
        if (generation <= generation_) {
            return false;
        }
        generation_ = generation;
        partitions_ = std::move(partitions);
        return true;
    }

    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }
    [[nodiscard]] const std::set<int>& partitions() const noexcept { return partitions_; }

private:
    std::uint64_t generation_{0};
    std::set<int> partitions_;
};

struct GroupMember {
    std::string member_id;
    HostInfo host_info;
    std::set<std::string> store_names;
    AssignmentCallback on_assignment;
};

/**
 * @brief Membership of every engine sharing one application id
 *
 * Each join or leave reassigns partitions 0..num_partitions-1
 * round-robin over the members ordered by member id, then hands every
 * remaining member its new assignment. Callbacks run on the thread
 * that joined or left, outside the coordinator lock, and carry the
 * generation of the rebalance that produced them.
 */
class GroupCoordinator {
public:
    GroupCoordinator(std::string application_id, int num_partitions);

    GroupCoordinator(const GroupCoordinator&) = delete;
    GroupCoordinator& operator=(const GroupCoordinator&) = delete;

    /**
     * @throws std::invalid_argument if the member id is already taken
     */
    void join(GroupMember member);

    void leave(const std::string& member_id);

    /**
     * @brief Member serving the partition a serialized key falls on
     *
     * If the partition owner does not host the store, the first member
     * that does is returned. nullopt if no member hosts the store.
     */
    [[nodiscard]] std::optional<StreamsMetadata> metadata_for_key(
        const std::string& store_name,
        const Bytes& serialized_key
    ) const;

    [[nodiscard]] std::vector<StreamsMetadata> all_metadata() const;

    [[nodiscard]] std::vector<StreamsMetadata> all_metadata_for_store(const std::string& store_name) const;

    [[nodiscard]] const std::string& application_id() const noexcept { return application_id_; }
    [[nodiscard]] int num_partitions() const noexcept { return num_partitions_; }
    [[nodiscard]] std::uint64_t generation() const;
    [[nodiscard]] std::size_t member_count() const;

private:
    struct Member {
        GroupMember info;
        std::set<int> partitions;
    };

    struct Notification {
        AssignmentCallback callback;
        std::uint64_t generation;
        std::set<int> partitions;
    };

    // Callers hold mutex_
    std::vector<Notification> rebalance();
    static StreamsMetadata to_metadata(const Member& member);

    static void notify(const std::vector<Notification>& notifications);

    std::string application_id_;
    int num_partitions_;

    mutable std::mutex mutex_;
    std::map<std::string, Member> members_;
    std::uint64_t generation_{0};
};

} // namespace streamiq
