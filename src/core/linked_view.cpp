#include "obseq/linked_view.hpp"
#include <stdexcept>

namespace obseq {

ElementId LinkedView::next(ElementId element) const {
    if (element == RIGHT_SENTINEL || element == NO_ELEMENT) {
        throw std::out_of_range("LinkedView::next: no element after the right end");
    }
    ElementId raw = traversal_->next(element == LEFT_SENTINEL ? NO_ELEMENT : element);
    return raw == NO_ELEMENT ? RIGHT_SENTINEL : raw;
}

ElementId LinkedView::prev(ElementId element) const {
    if (element == LEFT_SENTINEL || element == NO_ELEMENT) {
        throw std::out_of_range("LinkedView::prev: no element before the left end");
    }
    ElementId raw = traversal_->prev(element == RIGHT_SENTINEL ? NO_ELEMENT : element);
    return raw == NO_ELEMENT ? LEFT_SENTINEL : raw;
}

bool LinkedView::is_rightmost(ElementId element) const {
    if (element == RIGHT_SENTINEL) return true;
    return traversal_->next(element == LEFT_SENTINEL ? NO_ELEMENT : element) == NO_ELEMENT;
}

bool LinkedView::is_leftmost(ElementId element) const {
    if (element == LEFT_SENTINEL) return true;
    return traversal_->prev(element == RIGHT_SENTINEL ? NO_ELEMENT : element) == NO_ELEMENT;
}

} // namespace obseq
