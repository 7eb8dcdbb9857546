/**
 * @file element_list.hpp
 * @brief スクリプト用の要素列（クライアント側アリーナ）
 */
#ifndef OBSEQ_SCRIPT_ELEMENT_LIST_HPP
#define OBSEQ_SCRIPT_ELEMENT_LIST_HPP

#include "obseq/linked_view.hpp"
#include <cstdint>
#include <vector>

namespace obseq {
namespace script {

/**
 * @brief 重み付き要素の双方向リスト
 *
 * ノードは vector に格納し、インデックスを ElementId として使う。
 * 削除したハンドルはフリーリスト経由で再利用する。
 */
class ElementList : public Traversal {
public:
    using weight_type = int64_t;

    ElementList() = default;

    ElementId next(ElementId element) const override;
    ElementId prev(ElementId element) const override;

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    /**
     * @brief 位置から要素を取得（O(位置)）
     * @throws std::out_of_range 位置が範囲外の場合
     */
    ElementId at(size_t position) const;

    /**
     * @brief 要素の位置（O(n)）
     * @throws std::invalid_argument 要素が列にない場合
     */
    size_t position(ElementId element) const;

    /**
     * @brief position の直前に要素を挿入（position == size() なら末尾）
     * @return 挿入した要素
     * @throws std::out_of_range 位置が範囲外の場合
     * @throws std::invalid_argument 重みが負の場合
     */
    ElementId insert(size_t position, weight_type weight);

    /**
     * @brief 末尾に要素を追加
     */
    ElementId push_back(weight_type weight) { return insert(size_, weight); }

    /**
     * @brief position の要素を削除
     * @throws std::out_of_range 位置が範囲外の場合
     */
    void erase(size_t position);

    /**
     * @brief 要素の重みを取得
     */
    weight_type weight(ElementId element) const;

    /**
     * @brief 要素の重みを変更
     * @throws std::invalid_argument 重みが負の場合
     */
    void set_weight(ElementId element, weight_type weight);

    /**
     * @brief 全要素を先頭から順に取得
     */
    std::vector<ElementId> elements() const;

private:
    struct Node {
        weight_type weight = 0;
        ElementId prev = NO_ELEMENT;
        ElementId next = NO_ELEMENT;
        bool alive = false;
    };

    const Node& node(ElementId element) const;

    std::vector<Node> nodes_;
    std::vector<ElementId> free_;
    ElementId first_ = NO_ELEMENT;
    ElementId last_ = NO_ELEMENT;
    size_t size_ = 0;
};

} // namespace script
} // namespace obseq

#endif // OBSEQ_SCRIPT_ELEMENT_LIST_HPP
