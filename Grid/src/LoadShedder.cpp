#include "LoadShedder.hpp"

#include <algorithm>
#include <utility>

LoadShedder::LoadShedder(std::vector<ConsumerLoad> loads, int protected_priority)
    : loads_(std::move(loads)),
      protected_priority_(protected_priority) {
    std::stable_sort(loads_.begin(), loads_.end(),
                     [](const ConsumerLoad& a, const ConsumerLoad& b) {
                         if (a.priority != b.priority) return a.priority > b.priority;
                         return a.flexibility > b.flexibility;
                     });
}

std::vector<ShedAction> LoadShedder::plan(double deficit_kw) const {
    std::vector<ShedAction> out;
    double remaining = deficit_kw;
    for (const auto& l : loads_) {
        if (remaining <= 0.0) break;
        if (l.priority <= protected_priority_) continue;

        const double flexible = l.demand_kw * std::clamp(l.flexibility, 0.0, 1.0);
        const double cut = std::min(flexible, remaining);
        if (cut <= 0.0) continue;

        out.push_back(ShedAction{l.id, cut});
        remaining -= cut;
    }
    return out;
}

double LoadShedder::sheddableKw() const {
    double s = 0.0;
    for (const auto& l : loads_) {
        if (l.priority > protected_priority_) {
            s += l.demand_kw * std::clamp(l.flexibility, 0.0, 1.0);
        }
    }
    return s;
}
