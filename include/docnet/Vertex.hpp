#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace docnet {

// Stable identity of a vertex inside a store. 0 means "not in any store".
using Place = std::uint64_t;

// JSON flavour used for snapshots and packs. Keeps key insertion order.
using Json = nlohmann::ordered_json;

// The field bag. Values are any JSON value (string, number, bool, null,
// array or nested object).
using Fields = Json;

class GraphStore;

class Vertex {
public:
    Vertex();
    // Seeds the fields from a JSON object. The vertex keeps its own copy.
    explicit Vertex(const Fields& init);
    virtual ~Vertex() = default;

    Vertex(const Vertex&) = delete;
    Vertex& operator=(const Vertex&) = delete;

    // --- FIELD ACCESS ---

    // Throws MissingField if the field is absent
    const Fields& get(const std::string& name) const;
    const Fields& operator[](const std::string& name) const { return get(name); }

    // Base vertices accept anything. Subclasses may validate and throw.
    virtual void set(const std::string& name, Fields value);

    // Throws MissingField if the field is absent
    void remove(const std::string& name);

    bool has(const std::string& name) const;
    std::vector<std::string> keys() const;
    size_t size() const { return elements_.size(); }
    const Fields& fields() const { return elements_; }

    // --- INSERTION STATE ---

    Place place() const { return place_; }
    bool is_inserted() const { return place_ != 0; }

    // Called once by the store after the place is assigned
    virtual void on_insert() {}

    // Consulted by the store before anything is mutated
    virtual bool is_ready_for_insertion() const { return true; }

    // --- SERIALIZATION ---

    // Independent copy of all the fields, safe to store
    virtual Fields pack() const;

    // Default vertex factory used when a store is loaded
    static std::shared_ptr<Vertex> from_pack(const Fields& pack);

    std::string to_string() const;

private:
    friend class GraphStore;

    Place place_ = 0;
    Fields elements_;
};

using VertexPtr = std::shared_ptr<Vertex>;

}
