#include "layout/quad_tree.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace netmap {

namespace {

constexpr double kMinDistanceSq = 1e-9;

} // namespace

void QuadTree::build(const std::vector<Point>& points, const std::vector<double>& masses, int max_depth) {
    nodes_.clear();
    points_ = &points;
    masses_ = &masses;
    max_depth_ = max_depth;

    if (points.empty()) return;

    double min_x = std::numeric_limits<double>::max();
    double min_y = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = std::numeric_limits<double>::lowest();
    for (const auto& p : points) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
    }

    // Square root cell, stretched slightly so boundary points fall inside
    const double eps = 1e-4;
    double size = std::max(max_x - min_x, max_y - min_y) + 2 * eps;

    nodes_.reserve(points.size() * 2);
    make_node(min_x - eps, min_y - eps, size, 0);
    for (size_t i = 0; i < points.size(); ++i) {
        insert(0, i);
    }
    summarize(0);
}

int QuadTree::make_node(double min_x, double min_y, double size, int depth) {
    Node node;
    node.min_x = min_x;
    node.min_y = min_y;
    node.size = size;
    node.depth = depth;
    nodes_.push_back(std::move(node));
    return static_cast<int>(nodes_.size() - 1);
}

void QuadTree::add_to_child(int node, size_t item) {
    const Point& p = (*points_)[item];
    const Node& n = nodes_[node];
    double half = n.size * 0.5;
    int quadrant = (p.x < n.min_x + half ? 0 : 1) + (p.y < n.min_y + half ? 0 : 2);
    insert(n.children[quadrant], item);
}

void QuadTree::insert(int node, size_t item) {
    if (!nodes_[node].is_leaf()) {
        add_to_child(node, item);
        return;
    }

    if (!nodes_[node].items.empty() && nodes_[node].depth < max_depth_) {
        // Split: push the resident point and the new one down a level.
        // make_node may reallocate nodes_, so copy what we need first.
        double half = nodes_[node].size * 0.5;
        double x0 = nodes_[node].min_x;
        double y0 = nodes_[node].min_y;
        int depth = nodes_[node].depth + 1;

        int tl = make_node(x0, y0, half, depth);
        int tr = make_node(x0 + half, y0, half, depth);
        int bl = make_node(x0, y0 + half, half, depth);
        int br = make_node(x0 + half, y0 + half, half, depth);
        nodes_[node].children[0] = tl;
        nodes_[node].children[1] = tr;
        nodes_[node].children[2] = bl;
        nodes_[node].children[3] = br;

        std::vector<size_t> resident;
        resident.swap(nodes_[node].items);
        for (size_t r : resident) {
            add_to_child(node, r);
        }
        add_to_child(node, item);
        return;
    }

    nodes_[node].items.push_back(item);
}

void QuadTree::summarize(int node) {
    double mass = 0.0, sx = 0.0, sy = 0.0;

    if (!nodes_[node].is_leaf()) {
        for (int c = 0; c < 4; ++c) {
            int child = nodes_[node].children[c];
            summarize(child);
            const Node& cn = nodes_[child];
            mass += cn.mass;
            sx += cn.cx * cn.mass;
            sy += cn.cy * cn.mass;
        }
    }
    for (size_t item : nodes_[node].items) {
        double m = (*masses_)[item];
        mass += m;
        sx += (*points_)[item].x * m;
        sy += (*points_)[item].y * m;
    }

    Node& n = nodes_[node];
    n.mass = mass;
    if (mass > 0.0) {
        n.cx = sx / mass;
        n.cy = sy / mass;
    }
}

bool QuadTree::contains(const Node& node, const Point& p) const {
    return p.x >= node.min_x && p.x <= node.min_x + node.size &&
           p.y >= node.min_y && p.y <= node.min_y + node.size;
}

Point QuadTree::repulsion(size_t self, double coeff, double theta) const {
    Point force;
    if (nodes_.empty()) return force;
    accumulate(0, self, coeff, theta * theta, force);
    return force;
}

void QuadTree::accumulate(int node, size_t self, double coeff, double theta_sq, Point& force) const {
    const Node& n = nodes_[node];
    if (n.mass <= 0.0) return;

    const Point& p = (*points_)[self];
    const double self_mass = (*masses_)[self];

    if (!n.is_leaf()) {
        double dx = p.x - n.cx;
        double dy = p.y - n.cy;
        double dist_sq = dx * dx + dy * dy;

        // Barnes-Hut opening criterion
        bool super_node = !contains(n, p) && dist_sq > kMinDistanceSq &&
                          (n.size * n.size) / dist_sq <= theta_sq;
        if (super_node) {
            double f = coeff * self_mass * n.mass / dist_sq;
            force.x += dx * f;
            force.y += dy * f;
            return;
        }
        for (int c = 0; c < 4; ++c) {
            accumulate(n.children[c], self, coeff, theta_sq, force);
        }
    }

    for (size_t item : n.items) {
        if (item == self) continue;
        const Point& q = (*points_)[item];
        double dx = p.x - q.x;
        double dy = p.y - q.y;
        double dist_sq = dx * dx + dy * dy;
        if (dist_sq < kMinDistanceSq) continue;
        double f = coeff * self_mass * (*masses_)[item] / dist_sq;
        force.x += dx * f;
        force.y += dy * f;
    }
}

} // namespace netmap
