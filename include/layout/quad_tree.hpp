#pragma once

#include <cstddef>
#include <vector>

namespace netmap {

struct Point {
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief Barnes-Hut quadtree over weighted points
 *
 * A node holds at most one point until it is split; at max depth points
 * accumulate in the leaf. Each node caches its total mass and mass-weighted
 * center so distant groups can be treated as a single super node.
 */
class QuadTree {
public:
    QuadTree() = default;

    /**
     * @brief Rebuild the tree over `points` with per-point `masses`
     */
    void build(const std::vector<Point>& points, const std::vector<double>& masses, int max_depth = 8);

    /**
     * @brief Repulsive force on point `self`
     *
     * Force magnitude between two bodies is coeff * m_a * m_b / distance,
     * pushing them apart. A node whose extent S and distance d satisfy
     * S^2 / d^2 <= theta^2 (and which does not contain the point) is
     * approximated by its center of mass. theta = 0 gives the exact sum.
     */
    Point repulsion(size_t self, double coeff, double theta) const;

    size_t node_count() const { return nodes_.size(); }

private:
    struct Node {
        double min_x = 0.0, min_y = 0.0, size = 0.0;
        int depth = 0;
        int children[4] = {-1, -1, -1, -1};
        std::vector<size_t> items;
        double mass = 0.0;
        double cx = 0.0, cy = 0.0;    // mass-weighted center

        bool is_leaf() const { return children[0] < 0; }
    };

    std::vector<Node> nodes_;
    const std::vector<Point>* points_ = nullptr;
    const std::vector<double>* masses_ = nullptr;
    int max_depth_ = 8;

    int make_node(double min_x, double min_y, double size, int depth);
    void insert(int node, size_t item);
    void add_to_child(int node, size_t item);
    void summarize(int node);
    bool contains(const Node& node, const Point& p) const;
    void accumulate(int node, size_t self, double coeff, double theta_sq, Point& force) const;
};

} // namespace netmap
