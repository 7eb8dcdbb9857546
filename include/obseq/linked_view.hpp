/**
 * @file linked_view.hpp
 * @brief クライアントの走査インターフェースと番兵付きビュー
 */
#ifndef OBSEQ_LINKED_VIEW_HPP
#define OBSEQ_LINKED_VIEW_HPP

#include "obseq/types.hpp"

namespace obseq {

/**
 * @brief クライアントが提供する双方向走査
 *
 * 要素列そのものはクライアントが所有する。エンジンは next/prev で
 * 辿るだけで、要素を保存しない。
 */
class Traversal {
public:
    virtual ~Traversal() = default;

    /**
     * @brief 次の要素
     * @param element 要素（NO_ELEMENT なら先頭要素を返す）
     * @return 次の要素、なければ NO_ELEMENT
     */
    virtual ElementId next(ElementId element) const = 0;

    /**
     * @brief 前の要素
     * @param element 要素（NO_ELEMENT なら末尾要素を返す）
     * @return 前の要素、なければ NO_ELEMENT
     */
    virtual ElementId prev(ElementId element) const = 0;
};

/**
 * @brief 番兵付きの走査ビュー
 *
 * 「要素なし」を NO_ELEMENT ではなく LEFT_SENTINEL / RIGHT_SENTINEL として
 * 扱い、内部アルゴリズムが端を比較可能な値として扱えるようにする。
 */
class LinkedView {
public:
    explicit LinkedView(const Traversal& traversal) : traversal_(&traversal) {}

    /**
     * @brief 次の要素（末尾の次は RIGHT_SENTINEL）
     * @throws std::out_of_range RIGHT_SENTINEL / NO_ELEMENT から進もうとした場合
     */
    ElementId next(ElementId element) const;

    /**
     * @brief 前の要素（先頭の前は LEFT_SENTINEL）
     * @throws std::out_of_range LEFT_SENTINEL / NO_ELEMENT から戻ろうとした場合
     */
    ElementId prev(ElementId element) const;

    /**
     * @brief element の右に実要素がないか（LEFT_SENTINEL なら列が空か）
     */
    bool is_rightmost(ElementId element) const;

    /**
     * @brief element の左に実要素がないか（RIGHT_SENTINEL なら列が空か）
     */
    bool is_leftmost(ElementId element) const;

    /**
     * @brief 列が空か
     */
    bool empty() const { return traversal_->next(NO_ELEMENT) == NO_ELEMENT; }

    const Traversal& traversal() const { return *traversal_; }

private:
    const Traversal* traversal_;
};

} // namespace obseq

#endif // OBSEQ_LINKED_VIEW_HPP
