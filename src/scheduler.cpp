#include "wisched/scheduler.hpp"
#include "wisched/dag/compatibility_graph.hpp"
#include "wisched/dag/longest_path.hpp"
#include "wisched/dag/path_reconstruction.hpp"
#include "wisched/dag/topological_sort.hpp"
#include <ostream>

namespace wisched {

Schedule solve(const IntervalStore& store, std::ostream* log) {
    Schedule schedule;

    dag::CompatibilityGraph compat(store.snapshot());
    if (log) {
        *log << "[solve] " << compat.order() << " intervals, "
             << compat.size() << " compatibility edges, "
             << compat.graph().roots().size() << " roots\n";
    }

    if (compat.order() == 0) {
        return schedule;
    }

    auto order = dag::kahn_topological_sort(compat.graph());
    if (log) {
        *log << "[solve] topological order:";
        for (auto v : order) {
            *log << " " << v;
        }
        *log << "\n";
    }

    auto paths = dag::relax_longest_paths(compat.graph(), order);
    dag::VertexId finish = *dag::select_best_endpoint(paths);

    for (auto v : dag::reconstruct_path(paths, finish)) {
        schedule.intervals.push_back(compat.interval(v));
    }
    schedule.total_cost = paths.best_cost[finish];

    if (log) {
        *log << "[solve] best path ends at vertex " << finish
             << " with cost " << schedule.total_cost
             << " over " << schedule.size() << " intervals\n";
    }

    return schedule;
}

Schedule solve(const std::vector<Triple>& triples, std::ostream* log) {
    IntervalStore store;
    for (const auto& triple : triples) {
        store.add(triple.start, triple.finish, triple.weight);
    }
    return solve(store, log);
}

} // namespace wisched
