#include "docnet/Vertex.hpp"
#include "docnet/Exceptions.hpp"

namespace docnet {

Vertex::Vertex() : elements_(Fields::object()) {}

Vertex::Vertex(const Fields& init) : elements_(Fields::object()) {
    if (init.is_null()) return;
    if (!init.is_object()) {
        throw TypeMismatch("a vertex can only be seeded from a JSON object, got " +
                           std::string(init.type_name()));
    }
    // Deep copy, later changes to `init` don't reach the vertex
    elements_ = init;
}

const Fields& Vertex::get(const std::string& name) const {
    auto it = elements_.find(name);
    if (it == elements_.end()) throw MissingField(name);
    return *it;
}

void Vertex::set(const std::string& name, Fields value) {
    elements_[name] = std::move(value);
}

void Vertex::remove(const std::string& name) {
    if (elements_.erase(name) == 0) throw MissingField(name);
}

bool Vertex::has(const std::string& name) const {
    return elements_.contains(name);
}

std::vector<std::string> Vertex::keys() const {
    std::vector<std::string> out;
    out.reserve(elements_.size());
    for (auto it = elements_.begin(); it != elements_.end(); ++it) {
        out.push_back(it.key());
    }
    return out;
}

Fields Vertex::pack() const {
    return elements_;
}

std::shared_ptr<Vertex> Vertex::from_pack(const Fields& pack) {
    return std::make_shared<Vertex>(pack);
}

std::string Vertex::to_string() const {
    return "<Vertex " + elements_.dump(-1, ' ', false, Fields::error_handler_t::replace) + ">";
}

}
