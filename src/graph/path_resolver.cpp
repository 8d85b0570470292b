#include <graph/path_resolver.hpp>
#include <utils/errors.hpp>
#include <algorithm>
#include <deque>
#include <unordered_map>

namespace SixDegrees {

PathResolver::PathResolver(GraphStore& store) : store_(store) {}

PathResult PathResolver::find(PersonId start, PersonId target, const PathConfig& config) {
    PathResult result;

    if (start == target) {
        result.status = PathStatus::Found;
        result.path = {start};
        return result;
    }

    // Parent of every discovered node; start is its own parent.
    // A node is recorded on first discovery, which is via a shortest path.
    std::unordered_map<PersonId, PersonId> parent;
    parent.emplace(start, start);

    std::deque<PersonId> queue;
    queue.push_back(start);

    while (!queue.empty()) {
        const PersonId current = queue.front();
        queue.pop_front();

        if (++result.nodes_dequeued > config.max_nodes) {
            throw SearchAborted(result.nodes_dequeued, config.max_nodes);
        }

        for (PersonId next : store_.co_stars(current)) {
            if (next == target) {
                result.path.push_back(target);
                for (PersonId node = current;; node = parent.at(node)) {
                    result.path.push_back(node);
                    if (node == start) break;
                }
                std::reverse(result.path.begin(), result.path.end());
                result.status = PathStatus::Found;
                return result;
            }
            if (parent.emplace(next, current).second) {
                queue.push_back(next);
            }
        }
    }

    return result;
}

} // namespace SixDegrees
