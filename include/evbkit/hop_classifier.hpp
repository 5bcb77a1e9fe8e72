#pragma once
// Proton hop function h(t) over the reaction-center sequence.
//
//   h(0) = 0,  h(t) = h(t-1) + dh(t)
//
//            (  0  if the center did not change
//   dh(t) = {  -1  if the new center is the most recent donor (backward hop)
//            ( +1  otherwise (forward hop); the old center becomes a donor
//
// Only the top of the donor history is consulted. A hop that skips back two
// or more donors is therefore counted as forward and pushes a new donor.

#include <cstddef>
#include <limits>
#include <vector>

#include "evbkit/types.hpp"

namespace evbkit {

// Donor id meaning "no prior donor"; never equal to a real center.
constexpr CenterId kNoDonor = std::numeric_limits<CenterId>::min();

// Append-only donor record. Grows on every forward hop, never popped.
class DonorStack {
public:
    DonorStack() : donors_(1, kNoDonor) {}

    void push(CenterId donor) { donors_.push_back(donor); }

    // The sentinel stays at index 0, so the vector is never empty.
    CenterId top() const noexcept { return donors_.back(); }

    // Number of real donors recorded (sentinel excluded)
    size_t depth() const noexcept { return donors_.size() - 1; }

    const std::vector<CenterId>& history() const noexcept { return donors_; }

private:
    std::vector<CenterId> donors_;
};

// Full classification. Throws EmptyTrajectoryError for an empty sequence.
HopTrace classify_hops(const std::vector<CenterId>& centers);

// Cumulative hop counts only; same length as `centers`.
std::vector<int64_t> hop_function(const std::vector<CenterId>& centers);

}  // namespace evbkit
