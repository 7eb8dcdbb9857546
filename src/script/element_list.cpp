#include "obseq/script/element_list.hpp"
#include <stdexcept>
#include <string>

namespace obseq {
namespace script {

const ElementList::Node& ElementList::node(ElementId element) const {
    if (element >= nodes_.size() || !nodes_[element].alive) {
        throw std::invalid_argument("ElementList: unknown element " + std::to_string(element));
    }
    return nodes_[element];
}

ElementId ElementList::next(ElementId element) const {
    if (element == NO_ELEMENT) return first_;
    return node(element).next;
}

ElementId ElementList::prev(ElementId element) const {
    if (element == NO_ELEMENT) return last_;
    return node(element).prev;
}

ElementId ElementList::at(size_t position) const {
    if (position >= size_) {
        throw std::out_of_range("ElementList::at: position " + std::to_string(position) +
                                " out of range (size " + std::to_string(size_) + ")");
    }
    ElementId e = first_;
    for (size_t i = 0; i < position; ++i) {
        e = nodes_[e].next;
    }
    return e;
}

size_t ElementList::position(ElementId element) const {
    node(element);
    size_t pos = 0;
    for (ElementId e = first_; e != element; e = nodes_[e].next) {
        ++pos;
    }
    return pos;
}

ElementId ElementList::insert(size_t position, weight_type weight) {
    if (position > size_) {
        throw std::out_of_range("ElementList::insert: position " + std::to_string(position) +
                                " out of range (size " + std::to_string(size_) + ")");
    }
    if (weight < 0) {
        throw std::invalid_argument("ElementList::insert: negative weight");
    }

    ElementId id;
    if (!free_.empty()) {
        id = free_.back();
        free_.pop_back();
    } else {
        id = nodes_.size();
        nodes_.emplace_back();
    }

    ElementId after = (position == size_) ? NO_ELEMENT : at(position);
    ElementId before = (after == NO_ELEMENT) ? last_ : nodes_[after].prev;

    Node& n = nodes_[id];
    n.weight = weight;
    n.prev = before;
    n.next = after;
    n.alive = true;

    if (before == NO_ELEMENT) first_ = id; else nodes_[before].next = id;
    if (after == NO_ELEMENT) last_ = id; else nodes_[after].prev = id;
    ++size_;
    return id;
}

void ElementList::erase(size_t position) {
    ElementId id = at(position);
    Node& n = nodes_[id];
    if (n.prev == NO_ELEMENT) first_ = n.next; else nodes_[n.prev].next = n.next;
    if (n.next == NO_ELEMENT) last_ = n.prev; else nodes_[n.next].prev = n.prev;
    n = Node{};
    free_.push_back(id);
    --size_;
}

ElementList::weight_type ElementList::weight(ElementId element) const {
    return node(element).weight;
}

void ElementList::set_weight(ElementId element, weight_type weight) {
    node(element);
    if (weight < 0) {
        throw std::invalid_argument("ElementList::set_weight: negative weight");
    }
    nodes_[element].weight = weight;
}

std::vector<ElementId> ElementList::elements() const {
    std::vector<ElementId> result;
    result.reserve(size_);
    for (ElementId e = first_; e != NO_ELEMENT; e = nodes_[e].next) {
        result.push_back(e);
    }
    return result;
}

} // namespace script
} // namespace obseq
