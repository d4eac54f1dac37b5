#pragma once

#include "Math.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace engine
{

struct Node
{
    Vec3 base;
    float phase_x = 0.0f;
    float phase_y = 0.0f;
    float phase_z = 0.0f;
    float speed = 0.0f;
};

struct Edge
{
    std::uint16_t a;
    std::uint16_t b;
};

/**
 * @brief Drifting point cloud with a distance-threshold edge set
 *
 * Nodes sit at fixed base positions uniformly distributed in a ball and wobble
 * around them with per-node sinusoidal offsets. Edges are rebuilt from scratch
 * every frame for every unordered pair closer than the threshold; nodes with
 * at least one qualifying neighbour are "connected" and fade in, the rest fade
 * out.
 *
 * Pure arithmetic: no clocks, no rendering.
 */
class NodeField
{
public:
    static constexpr std::size_t kNodeCount = 250;
    static constexpr std::size_t kMaxEdges = 10000;
    static constexpr float kEdgeThresholdSq = 2.5f;
    static constexpr float kBallRadius = 2.0f;
    static constexpr float kScaleRate = 0.1f;

    explicit NodeField(std::uint32_t seed, std::size_t count = kNodeCount);

    void updatePositions(float shape_time);

    // Pairs are visited as (0,1), (0,2) ... (1,2) ...; once max_edges are
    // recorded later pairs are dropped but still mark their endpoints.
    // suppress drops every edge and connection.
    void computeEdges(bool suppress, float threshold_sq = kEdgeThresholdSq, std::size_t max_edges = kMaxEdges);

    void smoothScales(float rate = kScaleRate);

    static Vec3 offset(const Node& node, float shape_time);

    std::size_t size() const { return nodes_.size(); }
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Vec3>& positions() const { return positions_; }
    const std::vector<Edge>& edges() const { return edges_; }
    const std::vector<std::uint8_t>& connected() const { return connected_; }
    const std::vector<float>& scales() const { return scales_; }

    // Test hook: place nodes explicitly, bypassing the drift.
    void setPositions(std::vector<Vec3> positions);

private:
    std::vector<Node> nodes_;
    std::vector<Vec3> positions_;
    std::vector<Edge> edges_;
    std::vector<std::uint8_t> connected_;
    std::vector<float> scales_;
};

} // namespace engine
