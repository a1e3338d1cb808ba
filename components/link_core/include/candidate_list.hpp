#ifndef VOICELINK_CANDIDATE_LIST_HPP_
#define VOICELINK_CANDIDATE_LIST_HPP_

#include <cstdint>
#include <vector>

#include "peer.hpp"

namespace voicelink {

/**
 * @class CandidateList
 * @brief Insertion-ordered set of discovered peers, unique by address.
 *
 * Not thread-safe; the owner serializes access.
 */
class CandidateList {
   public:
    /**
     * @brief Records a sighting of `peer`.
     * @return true if the peer was not in the list and has been appended.
     * A repeat sighting only refreshes its last_seen_order.
     */
    bool Record(const PeerId& peer);

    bool Contains(const PeerId& peer) const;

    void Clear();

    size_t size() const { return candidates_.size(); }
    bool empty() const { return candidates_.empty(); }

    const std::vector<PeerCandidate>& candidates() const {
        return candidates_;
    }

   private:
    std::vector<PeerCandidate> candidates_;
    uint32_t next_order_ = 0;
};

}  // namespace voicelink

#endif  // VOICELINK_CANDIDATE_LIST_HPP_
