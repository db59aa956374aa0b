#pragma once
#include <string>
#include <vector>

// A controllable consumer. priority 1 is the most critical load.
struct ConsumerLoad {
    std::string id;
    int         priority    = 5;
    double      demand_kw   = 0.0;
    double      flexibility = 0.0;   // fraction of demand that may be shed
};

struct ShedAction {
    std::string consumer_id;
    double      reduce_kw = 0.0;
};

// Chooses which loads to curtail to cover a deficit: least critical first,
// most flexible first within a priority. Critical loads (priority <=
// protected_priority) are never touched.
class LoadShedder {
public:
    explicit LoadShedder(std::vector<ConsumerLoad> loads, int protected_priority = 1);

    std::vector<ShedAction> plan(double deficit_kw) const;

    // Flexible capacity still available for shedding.
    double sheddableKw() const;

    const std::vector<ConsumerLoad>& loads() const { return loads_; }

private:
    std::vector<ConsumerLoad> loads_;
    int protected_priority_;
};
