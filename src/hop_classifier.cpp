#include "evbkit/hop_classifier.hpp"
#include "evbkit/errors.hpp"

namespace evbkit {

HopTrace classify_hops(const std::vector<CenterId>& centers) {
    if (centers.empty()) {
        throw EmptyTrajectoryError();
    }

    HopTrace trace;
    trace.counts.reserve(centers.size());
    trace.events.reserve(centers.size());
    trace.counts.push_back(0);
    trace.events.push_back(HopEvent::NONE);

    DonorStack donors;
    for (size_t t = 1; t < centers.size(); ++t) {
        const CenterId prev = centers[t - 1];
        const CenterId curr = centers[t];

        HopEvent ev = HopEvent::NONE;
        int64_t dh = 0;
        if (curr == prev) {
            ev = HopEvent::NONE;
        } else if (curr == donors.top()) {
            ev = HopEvent::BACKWARD;
            dh = -1;
            ++trace.n_backward;
        } else {
            ev = HopEvent::FORWARD;
            dh = 1;
            donors.push(prev);
            ++trace.n_forward;
        }

        trace.counts.push_back(trace.counts.back() + dh);
        trace.events.push_back(ev);
    }
    return trace;
}

std::vector<int64_t> hop_function(const std::vector<CenterId>& centers) {
    return classify_hops(centers).counts;
}

}  // namespace evbkit
