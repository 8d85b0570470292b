/**
 * @file path_resolver.hpp
 * @brief Shortest co-appearance path between two people (breadth-first)
 *
 * Nodes are person ids; two people are adjacent when they share a movie.
 * Adjacency is fetched from the GraphStore one node at a time and never
 * materialized. The search keeps one parent id per discovered node and walks
 * the parents back once the target is seen, so memory grows with the number
 * of visited nodes, not with path length.
 */

#pragma once

#include <graph/graph_store.hpp>
#include <export.hpp>
#include <cstddef>
#include <vector>

namespace SixDegrees {

struct PathConfig {
    size_t max_nodes = 1000000;  // Dequeue ceiling; exceeding it throws SearchAborted
};

enum class PathStatus {
    Found,
    NoPath
};

struct PathResult {
    PathStatus status = PathStatus::NoPath;
    std::vector<PersonId> path;   // start .. target inclusive when Found
    size_t nodes_dequeued = 0;

    bool found() const { return status == PathStatus::Found; }
    size_t hops() const { return path.empty() ? 0 : path.size() - 1; }
};

class SIXDEGREES_API PathResolver {
public:
    explicit PathResolver(GraphStore& store);

    /**
     * @brief Minimum-hop path from start to target.
     *
     * NoPath means the reachable component was exhausted. Throws
     * SearchAborted when more than config.max_nodes nodes are dequeued,
     * which says nothing about whether a path exists.
     */
    PathResult find(PersonId start, PersonId target, const PathConfig& config = {});

private:
    GraphStore& store_;
};

} // namespace SixDegrees
