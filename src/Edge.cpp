#include "docnet/Edge.hpp"
#include "docnet/Exceptions.hpp"
#include "docnet/GraphStore.hpp"
#include <utility>

namespace docnet {

std::string direction_to_string(Direction d) {
    switch (d) {
        case Direction::Out: return "out";
        case Direction::In: return "in";
        case Direction::None: return "none";
    }
    return "none";
}

Direction string_to_direction(const std::string& token) {
    if (token == "out") return Direction::Out;
    if (token == "in") return Direction::In;
    if (token == "none") return Direction::None;
    throw InvalidDirection("direction is either 'in', 'out' or 'none', got '" + token + "'");
}

Edge::Edge(VertexPtr start, VertexPtr end, std::string label, bool has_direction)
    : label_(std::move(label)), has_direction_(has_direction) {
    if (!start || !end || !start->is_inserted() || !end->is_inserted()) {
        throw VertexNotInserted("both vertices must be inserted to make an edge");
    }

    if (!has_direction_ && end->place() < start->place()) {
        std::swap(start, end);
    }
    start_ = std::move(start);
    end_ = std::move(end);
}

AnchoredEdge Edge::from_anchor(const VertexPtr& anchor,
                               const VertexPtr& other,
                               const std::string& label,
                               const std::string& direction) {
    Direction d = string_to_direction(direction);

    EdgePtr edge;
    switch (d) {
        case Direction::Out:
            edge = std::make_shared<Edge>(anchor, other, label, true);
            break;
        case Direction::In:
            edge = std::make_shared<Edge>(other, anchor, label, true);
            break;
        case Direction::None:
            // The constructor sorts the ends
            edge = std::make_shared<Edge>(anchor, other, label, false);
            break;
    }
    return {edge, EdgeView{anchor, other, d}};
}

EdgePtr Edge::from_pack(const Json& pack, const GraphStore& store) {
    auto is_place = [](const Json& v) {
        return v.is_number_unsigned() || (v.is_number_integer() && v.get<std::int64_t>() > 0);
    };
    if (!pack.is_array() || pack.size() < 4 ||
        !is_place(pack[0]) || !is_place(pack[1]) ||
        !pack[2].is_string() || !pack[3].is_boolean()) {
        throw CorruptSnapshot("invalid edge pack: " + pack.dump());
    }

    auto start = store.at(pack[0].get<Place>());
    auto end = store.at(pack[1].get<Place>());
    return std::make_shared<Edge>(start, end, pack[2].get<std::string>(), pack[3].get<bool>());
}

bool Edge::has_vertex(const VertexPtr& vertex) const {
    return start_ == vertex || end_ == vertex;
}

EdgeView Edge::change_anchor(const VertexPtr& anchor) const {
    if (!anchor || !has_vertex(anchor)) {
        throw AnchorMismatch("the given anchor doesn't belong to the edge");
    }

    EdgeView view;
    view.anchor = anchor;
    if (!has_direction_) {
        view.other = (anchor == start_) ? end_ : start_;
        view.direction = Direction::None;
    } else if (anchor == start_) {
        view.other = end_;
        view.direction = Direction::Out;
    } else {
        view.other = start_;
        view.direction = Direction::In;
    }
    return view;
}

Json Edge::pack() const {
    return Json::array({start_->place(), end_->place(), label_, has_direction_});
}

std::string Edge::to_string() const {
    if (has_direction_) {
        return "<Edge: from " + start_->to_string() + " to " + end_->to_string() +
               " with label '" + label_ + "'>";
    }
    return "<Edge: between " + start_->to_string() + " and " + end_->to_string() +
           " with label '" + label_ + "'>";
}

bool Edge::operator==(const Edge& other) const {
    return start_ == other.start_ &&
           end_ == other.end_ &&
           label_ == other.label_ &&
           has_direction_ == other.has_direction_;
}

}
