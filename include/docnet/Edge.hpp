#pragma once
#include <memory>
#include <string>
#include "docnet/Vertex.hpp"

namespace docnet {

class GraphStore;
class Edge;

using EdgePtr = std::shared_ptr<Edge>;

// Direction of an edge seen from one of its ends
enum class Direction {
    Out,  // anchor is the start
    In,   // anchor is the end
    None  // undirected
};

std::string direction_to_string(Direction d);
// Accepts "out", "in" and "none". Throws InvalidDirection otherwise.
Direction string_to_direction(const std::string& token);

// An edge seen from one of its vertices. Plain value, computed on demand,
// never stored on the edge itself.
struct EdgeView {
    VertexPtr anchor;
    VertexPtr other;
    Direction direction = Direction::None;
};

// An edge together with the view it was asked from (search_edge results,
// from_anchor)
struct AnchoredEdge {
    EdgePtr edge;
    EdgeView view;

    const VertexPtr& anchor() const { return view.anchor; }
    const VertexPtr& other() const { return view.other; }
    Direction direction() const { return view.direction; }
};

class Edge {
public:
    // Both vertices must be inserted. Undirected edges are stored with the
    // lowest place first, whatever the argument order.
    Edge(VertexPtr start, VertexPtr end, std::string label = "", bool has_direction = true);
    virtual ~Edge() = default;

    // --- FACTORIES ---

    // Builds the edge from the point of view of `anchor`:
    // "out" -> anchor is the start, "in" -> anchor is the end,
    // "none" -> undirected.
    static AnchoredEdge from_anchor(const VertexPtr& anchor,
                                    const VertexPtr& other,
                                    const std::string& label = "",
                                    const std::string& direction = "out");

    // Default edge factory. The pack is [start_place, end_place, label, has_direction].
    static EdgePtr from_pack(const Json& pack, const GraphStore& store);

    // --- CHECKS ---

    bool has_vertex(const VertexPtr& vertex) const;

    // Throws AnchorMismatch if `anchor` isn't one of the two ends
    EdgeView change_anchor(const VertexPtr& anchor) const;

    // --- EXPORT ---

    virtual Json pack() const;

    // Called by the store when the edge is inserted
    virtual void on_insert() {}

    std::string to_string() const;

    // Structural equality: same vertex instances, label and orientation
    bool operator==(const Edge& other) const;
    bool operator!=(const Edge& other) const { return !(*this == other); }

    const VertexPtr& start() const { return start_; }
    const VertexPtr& end() const { return end_; }
    const std::string& label() const { return label_; }
    bool has_direction() const { return has_direction_; }
    bool is_inserted() const { return is_inserted_; }

private:
    friend class GraphStore;

    VertexPtr start_;
    VertexPtr end_;
    std::string label_;
    bool has_direction_ = true;
    bool is_inserted_ = false;
};

}
