#include "docnet/GraphStore.hpp"
#include "docnet/Exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace docnet {

namespace fs = std::filesystem;

namespace {

const char* const kNextPlaceKey = "_next_place";
const char* const kEdgesKey = "edges";

// Snapshot keys are stringified places ("1", "2", ...)
Place parse_place(const std::string& key) {
    bool digits = !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (!digits) {
        throw CorruptSnapshot("unexpected key in snapshot: '" + key + "'");
    }

    Place place = 0;
    try {
        place = std::stoull(key);
    } catch (const std::out_of_range&) {
        throw CorruptSnapshot("place out of range: '" + key + "'");
    }
    if (place == 0) {
        throw CorruptSnapshot("place 0 is reserved for detached vertices");
    }
    return place;
}

}

GraphStore::GraphStore(std::string path, VertexFactory vertex_factory, EdgeFactory edge_factory)
    : path_(std::move(path)),
      make_vertex_(std::move(vertex_factory)),
      make_edge_(std::move(edge_factory)) {
    if (!make_vertex_ || !make_edge_) {
        throw TypeMismatch("vertex and edge factories must be callable");
    }
    load();  // Auto-load on startup
}

GraphStore::GraphStore(const StoreConfig& config, VertexFactory vertex_factory, EdgeFactory edge_factory)
    : GraphStore(config.path, std::move(vertex_factory), std::move(edge_factory)) {
    indent_ = config.indent;
}

// -------------------- persistence --------------------

void GraphStore::load() {
    // Handles from before the reload go back to detached
    for (auto& entry : vertices_) {
        entry.second->place_ = 0;
    }
    for (auto& edge : edges_) {
        edge->is_inserted_ = false;
    }
    vertices_.clear();
    edges_.clear();
    next_place_ = 1;

    fs::path file(path_);
    if (!fs::exists(file)) {
        spdlog::info("📂 No snapshot at {}, starting empty", path_);
        return;
    }

    std::ifstream f(file);
    if (!f.is_open()) {
        throw StorageError("cannot open snapshot " + path_);
    }

    Json doc = Json::parse(f);
    from_document(doc);

    spdlog::info("🧠 Graph loaded from {}: {} vertices, {} edges", path_, vertices_.size(), edges_.size());
}

void GraphStore::save() const {
    fs::path file(path_);
    if (file.has_parent_path() && !fs::exists(file.parent_path())) {
        fs::create_directories(file.parent_path());
    }

    std::ofstream f(file, std::ios::trunc);
    if (!f.is_open()) {
        throw StorageError("cannot open " + path_ + " for writing");
    }

    f << to_document().dump(indent_, ' ', false, Json::error_handler_t::replace);
    f.flush();
    if (!f) {
        throw StorageError("failed to write snapshot " + path_);
    }

    spdlog::info("💾 Graph saved to {}: {} vertices, {} edges", path_, vertices_.size(), edges_.size());
}

Json GraphStore::to_document() const {
    Json doc = Json::object();
    doc[kNextPlaceKey] = next_place_;

    Json packs = Json::array();
    for (const auto& edge : edges_) {
        packs.push_back(edge->pack());
    }
    doc[kEdgesKey] = std::move(packs);

    for (const auto& [place, vertex] : vertices_) {
        doc[std::to_string(place)] = vertex->pack();
    }
    return doc;
}

void GraphStore::from_document(const Json& doc) {
    if (!doc.is_object()) {
        throw CorruptSnapshot("snapshot root must be a JSON object");
    }

    std::optional<Place> stored_next;
    const Json* edge_packs = nullptr;

    // 1. Vertices (edges need them to resolve their places)
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& key = it.key();

        if (key == kNextPlaceKey) {
            if (!it->is_number_unsigned()) {
                throw CorruptSnapshot("_next_place must be a positive integer");
            }
            stored_next = it->get<Place>();
            continue;
        }
        if (key == kEdgesKey) {
            if (!it->is_array()) {
                throw CorruptSnapshot("edges must be an array");
            }
            edge_packs = &*it;
            continue;
        }

        Place place = parse_place(key);
        VertexPtr vertex = make_vertex_(*it);
        if (!vertex) {
            throw CorruptSnapshot("vertex factory returned nothing for place " + key);
        }
        vertex->place_ = place;
        vertices_[place] = vertex;
    }

    // 2. Place counter
    Place highest = vertices_.empty() ? 0 : vertices_.rbegin()->first;
    if (!stored_next) {
        // Older snapshots only hold the vertices
        spdlog::info("Snapshot {} has no {}, resuming after place {}", path_, kNextPlaceKey, highest);
        next_place_ = highest + 1;
    } else if (*stored_next <= highest) {
        spdlog::warn("⚠️ {} in {} is behind the stored vertices ({} <= {}), resuming after place {}",
                     kNextPlaceKey, path_, *stored_next, highest, highest);
        next_place_ = highest + 1;
    } else {
        next_place_ = *stored_next;
    }

    // 3. Edges
    if (edge_packs) {
        for (const auto& pack : *edge_packs) {
            EdgePtr edge = make_edge_(pack, *this);
            if (!edge) {
                throw CorruptSnapshot("edge factory returned nothing for " + pack.dump());
            }
            edge->is_inserted_ = true;
            edges_.push_back(edge);
        }
    }
}

// -------------------- vertices --------------------

Place GraphStore::insert(const VertexPtr& vertex) {
    if (!vertex) {
        throw TypeMismatch("insert expects a vertex, got null");
    }
    if (vertex->is_inserted()) {
        throw AlreadyInserted("vertex is already inserted at place " + std::to_string(vertex->place()));
    }
    if (!vertex->is_ready_for_insertion()) {
        throw NotReady("vertex is not ready for insertion");
    }

    Place place = next_place_++;
    vertex->place_ = place;
    try {
        vertex->on_insert();
    } catch (...) {
        // The place stays retired, the vertex goes back to detached
        vertex->place_ = 0;
        throw;
    }
    vertices_[place] = vertex;

    spdlog::debug("Vertex inserted at place {}", place);
    return place;
}

Place GraphStore::remove(const VertexPtr& vertex) {
    if (!vertex) {
        throw TypeMismatch("remove expects a vertex, got null");
    }
    if (!contains(vertex)) {
        throw NotInserted("vertex is not inserted in this store");
    }

    Place place = vertex->place();
    for (const auto& edge : edges_) {
        if (edge->has_vertex(vertex)) {
            throw StillConnected("vertex at place " + std::to_string(place) + " still has edges");
        }
    }

    vertices_.erase(place);
    vertex->place_ = 0;

    spdlog::debug("Vertex removed from place {}", place);
    return place;
}

VertexPtr GraphStore::at(Place place) const {
    auto it = vertices_.find(place);
    if (it == vertices_.end()) {
        throw NotFound("no vertex at place " + std::to_string(place));
    }
    return it->second;
}

bool GraphStore::contains(const VertexPtr& vertex) const {
    if (!vertex || !vertex->is_inserted()) return false;
    auto it = vertices_.find(vertex->place());
    return it != vertices_.end() && it->second == vertex;
}

VertexRange GraphStore::all() const {
    return VertexRange(vertices_, [](const VertexMap::value_type& entry) -> std::optional<VertexPtr> {
        return entry.second;
    });
}

VertexRange GraphStore::search(std::function<bool(const Vertex&)> predicate) const {
    if (!predicate) {
        throw TypeMismatch("search expects a predicate");
    }
    return VertexRange(vertices_, [predicate](const VertexMap::value_type& entry) -> std::optional<VertexPtr> {
        try {
            if (predicate(*entry.second)) return entry.second;
        } catch (const MissingField&) {
            // A vertex without the field simply doesn't match
        } catch (const Json::out_of_range&) {
            // Same for a nested lookup, e.g. v["info"].at("age")
        }
        return std::nullopt;
    });
}

// -------------------- edges --------------------

void GraphStore::insert_edge(const EdgePtr& edge) {
    if (!edge) {
        throw TypeMismatch("insert_edge expects an edge, got null");
    }
    if (edge->is_inserted()) {
        throw AlreadyInserted("edge is already inserted");
    }
    if (!contains(edge->start()) || !contains(edge->end())) {
        throw NotInserted("both vertices of the edge must be inserted in this store");
    }

    edge->is_inserted_ = true;
    try {
        edge->on_insert();
    } catch (...) {
        edge->is_inserted_ = false;
        throw;
    }
    edges_.push_back(edge);

    spdlog::debug("Edge inserted: {} -> {} '{}'", edge->start()->place(), edge->end()->place(), edge->label());
}

EdgePtr GraphStore::make_edge(const VertexPtr& v1, const VertexPtr& v2,
                              const std::string& label, bool has_direction) {
    auto edge = std::make_shared<Edge>(v1, v2, label, has_direction);
    insert_edge(edge);
    return edge;
}

void GraphStore::remove_edge(const Edge& edge) {
    auto it = std::find_if(edges_.begin(), edges_.end(), [&edge](const EdgePtr& e) {
        return *e == edge;
    });
    if (it == edges_.end()) {
        throw NotFound("no matching edge in the store");
    }

    // `edge` may be the stored edge itself, log before dropping it
    spdlog::debug("Edge removed: {} -> {} '{}'", edge.start()->place(), edge.end()->place(), edge.label());

    (*it)->is_inserted_ = false;
    edges_.erase(it);
}

void GraphStore::remove_edge(const VertexPtr& v1, const VertexPtr& v2,
                             const std::string& label, bool has_direction) {
    remove_edge(Edge(v1, v2, label, has_direction));
}

EdgeRange GraphStore::search_edge(const VertexPtr& v1,
                                  const VertexPtr& v2,
                                  const std::optional<std::string>& label,
                                  const std::string& direction) const {
    if (!v1) {
        throw TypeMismatch("search_edge expects a vertex, got null");
    }

    std::optional<Direction> wanted;
    if (direction != "all") {
        wanted = string_to_direction(direction);
    }

    return EdgeRange(edges_, [v1, v2, label, wanted](const EdgePtr& edge) -> std::optional<AnchoredEdge> {
        // 1. Only the edges of v1, seen from v1
        if (!edge->has_vertex(v1)) return std::nullopt;
        EdgeView view = edge->change_anchor(v1);

        // 2. Other end
        if (v2 && view.other != v2) return std::nullopt;

        // 3. Direction
        if (wanted && view.direction != *wanted) return std::nullopt;

        // 4. Label, "" is a label like any other
        if (label && edge->label() != *label) return std::nullopt;

        return AnchoredEdge{edge, view};
    });
}

std::string GraphStore::to_string() const {
    return "<GraphStore " + fs::absolute(path_).string() + ">";
}

}
