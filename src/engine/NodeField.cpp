#include "NodeField.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace engine
{

NodeField::NodeField(std::uint32_t seed, std::size_t count)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    nodes_.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        float theta = kTwoPi * unit(rng);
        float phi = std::acos(std::clamp(2.0f * unit(rng) - 1.0f, -1.0f, 1.0f));
        float r = kBallRadius * std::cbrt(unit(rng));

        Node n;
        n.base = { r * std::sin(phi) * std::cos(theta), r * std::sin(phi) * std::sin(theta), r * std::cos(phi) };
        n.phase_x = unit(rng) * kTwoPi;
        n.phase_y = unit(rng) * kTwoPi;
        n.phase_z = unit(rng) * kTwoPi;
        n.speed = 0.15f + unit(rng) * 0.4f;
        nodes_.push_back(n);
    }

    positions_.resize(count);
    connected_.assign(count, 0);
    scales_.assign(count, 1.0f);
    edges_.reserve(kMaxEdges);
    updatePositions(0.0f);
}

Vec3 NodeField::offset(const Node& node, float shape_time)
{
    float t1 = shape_time * node.speed + node.phase_x;
    float t2 = shape_time * node.speed * 0.73f + node.phase_y;
    float t3 = shape_time * node.speed * 1.37f + node.phase_z;

    return { (std::sin(t1) + std::sin(t2 * 1.4f) * 0.5f) * 1.5f, (std::cos(t2) + std::cos(t3 * 1.1f) * 0.5f) * 1.5f,
             (std::sin(t3) + std::cos(t1 * 0.9f) * 0.5f) * 1.5f };
}

void NodeField::updatePositions(float shape_time)
{
    for (std::size_t i = 0; i < nodes_.size(); ++i)
    {
        positions_[i] = nodes_[i].base + offset(nodes_[i], shape_time);
    }
}

void NodeField::setPositions(std::vector<Vec3> positions)
{
    positions_ = std::move(positions);
    positions_.resize(nodes_.size());
}

void NodeField::computeEdges(bool suppress, float threshold_sq, std::size_t max_edges)
{
    edges_.clear();
    std::fill(connected_.begin(), connected_.end(), std::uint8_t{ 0 });
    if (suppress)
        return;

    const std::size_t n = positions_.size();
    for (std::size_t i = 0; i < n; ++i)
    {
        for (std::size_t j = i + 1; j < n; ++j)
        {
            if (distanceSquared(positions_[i], positions_[j]) >= threshold_sq)
                continue;

            connected_[i] = 1;
            connected_[j] = 1;
            if (edges_.size() < max_edges)
            {
                edges_.push_back({ static_cast<std::uint16_t>(i), static_cast<std::uint16_t>(j) });
            }
        }
    }
}

void NodeField::smoothScales(float rate)
{
    for (std::size_t i = 0; i < scales_.size(); ++i)
    {
        float target = connected_[i] ? 1.0f : 0.0f;
        scales_[i] += (target - scales_[i]) * rate;
    }
}

} // namespace engine
