/**
 * @file types.hpp
 * @brief 要素ハンドルと番兵の定義
 */
#ifndef OBSEQ_TYPES_HPP
#define OBSEQ_TYPES_HPP

#include <cstddef>
#include <cstdint>

namespace obseq {

/**
 * @brief 要素ハンドル
 *
 * クライアントが所有するアリーナ内のインデックス。
 * RIGHT_SENTINEL 未満の値のみ有効な要素を表す。
 */
using ElementId = size_t;

/// 要素なし
constexpr ElementId NO_ELEMENT = SIZE_MAX;

/// 左番兵（先頭要素の直前）
constexpr ElementId LEFT_SENTINEL = SIZE_MAX - 1;

/// 右番兵（末尾要素の直後）
constexpr ElementId RIGHT_SENTINEL = SIZE_MAX - 2;

/// 未定義インデックス
constexpr size_t NO_INDEX = SIZE_MAX;

/**
 * @brief 実要素かどうか（番兵・NO_ELEMENT でない）
 */
inline bool is_real(ElementId e) { return e < RIGHT_SENTINEL; }

/**
 * @brief カット位置の向き
 */
enum class Side {
    Left,   // 要素の直前で切る（要素からグループが始まる）
    Right   // 要素の直後で切る（要素でグループが終わる）
};

/**
 * @brief 確定したカット位置
 */
struct Cut {
    ElementId element = NO_ELEMENT;
    Side side = Side::Right;

    bool operator==(const Cut& other) const {
        return element == other.element && side == other.side;
    }
    bool operator!=(const Cut& other) const { return !(*this == other); }
};

} // namespace obseq

#endif // OBSEQ_TYPES_HPP
