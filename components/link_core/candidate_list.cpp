#include "candidate_list.hpp"

#include <algorithm>

namespace voicelink {

bool CandidateList::Record(const PeerId& peer) {
    const uint32_t order = next_order_++;
    auto it = std::find_if(
        candidates_.begin(), candidates_.end(),
        [&peer](const PeerCandidate& c) { return c.peer == peer; });
    if (it != candidates_.end()) {
        it->last_seen_order = order;
        return false;
    }
    candidates_.push_back(PeerCandidate{peer, order});
    return true;
}

bool CandidateList::Contains(const PeerId& peer) const {
    return std::any_of(
        candidates_.begin(), candidates_.end(),
        [&peer](const PeerCandidate& c) { return c.peer == peer; });
}

void CandidateList::Clear() {
    candidates_.clear();
    next_order_ = 0;
}

}  // namespace voicelink
