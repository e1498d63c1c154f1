#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "docnet/Edge.hpp"
#include "docnet/LazyRange.hpp"
#include "docnet/StoreConfig.hpp"
#include "docnet/Vertex.hpp"

namespace docnet {

// Builds a vertex (or a subclass) from its stored pack
using VertexFactory = std::function<VertexPtr(const Fields& pack)>;
// Builds an edge (or a subclass) from its stored pack. The store is given to
// resolve places into vertices.
using EdgeFactory = std::function<EdgePtr(const Json& pack, const GraphStore& store)>;

using VertexMap = std::map<Place, VertexPtr>;
using EdgeList = std::vector<EdgePtr>;

using VertexRange = LazyRange<VertexMap, VertexPtr>;
using EdgeRange = LazyRange<EdgeList, AnchoredEdge>;

// An in-memory document/graph store backed by a single JSON file.
//
// Vertices get a place (1, 2, 3...) on insertion. A place is never given
// twice, even after the vertex has been removed. Edges may only link
// vertices of this store, and a vertex can't be removed while an edge
// still uses it.
//
// Not thread-safe. Nothing is written to disk until save() is called.
class GraphStore {
public:
    // Loads `path` right away if it exists
    explicit GraphStore(std::string path,
                        VertexFactory vertex_factory = &Vertex::from_pack,
                        EdgeFactory edge_factory = &Edge::from_pack);
    explicit GraphStore(const StoreConfig& config,
                        VertexFactory vertex_factory = &Vertex::from_pack,
                        EdgeFactory edge_factory = &Edge::from_pack);

    GraphStore(const GraphStore&) = delete;
    GraphStore& operator=(const GraphStore&) = delete;

    // --- PERSISTENCE ---

    // Forgets everything in memory (vertices and edges held so far become
    // detached), then reads the file if there is one.
    // On failure the store is left half-loaded and must be discarded.
    void load();

    // Overwrites the file (parent directories are created). Not atomic.
    void save() const;

    const std::string& path() const { return path_; }

    // --- VERTICES ---

    // Returns the new place
    Place insert(const VertexPtr& vertex);
    // Returns the place the vertex had
    Place remove(const VertexPtr& vertex);

    // Throws NotFound
    VertexPtr at(Place place) const;
    VertexPtr operator[](Place place) const { return at(place); }

    // True only if this very instance is stored at its place
    bool contains(const VertexPtr& vertex) const;
    size_t size() const { return vertices_.size(); }
    Place next_place() const { return next_place_; }

    VertexRange all() const;

    // Vertices for which `predicate` is true. A vertex whose predicate throws
    // MissingField or json::out_of_range (missing nested key) is skipped, any
    // other exception goes up to the caller.
    VertexRange search(std::function<bool(const Vertex&)> predicate) const;

    // --- EDGES ---

    void insert_edge(const EdgePtr& edge);
    // Builds the edge and inserts it
    EdgePtr make_edge(const VertexPtr& v1, const VertexPtr& v2,
                      const std::string& label = "", bool has_direction = true);

    // Removes the first edge equal to `edge` (one only, even with duplicates).
    // Throws NotFound.
    void remove_edge(const Edge& edge);
    // Throws VertexNotInserted if v1 or v2 is detached
    void remove_edge(const VertexPtr& v1, const VertexPtr& v2,
                     const std::string& label = "", bool has_direction = true);

    const EdgeList& edges() const { return edges_; }

    // Edges touching `v1`, seen from `v1`. Optional filters on the other end
    // (same instance), the label (exact, "" included) and the direction
    // ("all", "out", "in" or "none").
    EdgeRange search_edge(const VertexPtr& v1,
                          const VertexPtr& v2 = nullptr,
                          const std::optional<std::string>& label = std::nullopt,
                          const std::string& direction = "all") const;

    std::string to_string() const;

private:
    Json to_document() const;
    void from_document(const Json& doc);

    std::string path_;
    int indent_ = -1;
    VertexFactory make_vertex_;
    EdgeFactory make_edge_;

    VertexMap vertices_;
    EdgeList edges_;
    Place next_place_ = 1;
};

}
