/**
 * @file candidates.hpp
 * @brief セルの候補数字集合（ビットマスク）
 */
#ifndef SUDOKU_CSP_CANDIDATES_HPP
#define SUDOKU_CSP_CANDIDATES_HPP

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sudoku_csp {

/**
 * @brief 1 つのセルに残っている候補数字 {1..9} の集合
 *
 * ビット d (1 <= d <= 9) が立っていれば数字 d が候補に残っている。
 * コピーは 2 バイトの値コピーなので、盤面の複製は配列コピーで済む。
 */
class Candidates {
public:
    using digit_type = int;
    using mask_type = uint16_t;

    static constexpr digit_type MIN_DIGIT = 1;
    static constexpr digit_type MAX_DIGIT = 9;

    /// {1..9} 全てを表すマスク
    static constexpr mask_type FULL_MASK = 0x3FE;

    /**
     * @brief 空集合を作成
     */
    Candidates() : mask_(0) {}

    /**
     * @brief マスクから作成（範囲外ビットは落とす）
     */
    explicit Candidates(mask_type mask) : mask_(mask & FULL_MASK) {}

    /**
     * @brief {1..9} を作成
     */
    static Candidates full() { return Candidates(FULL_MASK); }

    /**
     * @brief 単一数字の集合を作成（範囲外の数字なら空集合）
     */
    static Candidates single(digit_type digit) { return Candidates(bit(digit)); }

    /**
     * @brief 数字に対応するビット（範囲外の数字は 0）
     */
    static mask_type bit(digit_type digit) {
        if (digit < MIN_DIGIT || digit > MAX_DIGIT) return 0;
        return static_cast<mask_type>(1u << digit);
    }

    mask_type mask() const { return mask_; }

    bool empty() const { return mask_ == 0; }

    size_t size() const { return static_cast<size_t>(__builtin_popcount(mask_)); }

    bool contains(digit_type digit) const {
        return digit >= MIN_DIGIT && digit <= MAX_DIGIT && (mask_ & bit(digit)) != 0;
    }

    /**
     * @brief 単一数字に確定しているか
     */
    bool is_singleton() const { return mask_ != 0 && (mask_ & (mask_ - 1)) == 0; }

    /**
     * @brief 確定した数字を取得
     */
    std::optional<digit_type> value() const {
        if (is_singleton()) {
            return min();
        }
        return std::nullopt;
    }

    /**
     * @brief 最小の候補数字
     * @pre 空でないこと
     */
    digit_type min() const { return __builtin_ctz(mask_); }

    /**
     * @brief 数字を除去
     * @return 除去されたら true
     */
    bool remove(digit_type digit) {
        if (!contains(digit)) return false;
        mask_ = static_cast<mask_type>(mask_ & ~bit(digit));
        return true;
    }

    /**
     * @brief other に含まれる数字を全て除去
     * @return 除去した数字の個数
     */
    size_t remove_all(const Candidates& other) {
        size_t removed = (*this & other).size();
        mask_ = static_cast<mask_type>(mask_ & ~other.mask_);
        return removed;
    }

    /**
     * @brief other との共通部分に絞り込む
     * @return 除去した数字の個数
     */
    size_t intersect(const Candidates& other) {
        size_t before = size();
        mask_ = static_cast<mask_type>(mask_ & other.mask_);
        return before - size();
    }

    /**
     * @brief 指定数字のみに固定
     * @return 除去した数字の個数（digit が候補にない場合は空集合になる）
     */
    size_t assign(digit_type digit) { return intersect(single(digit)); }

    bool is_subset_of(const Candidates& other) const { return (mask_ & ~other.mask_) == 0; }
    bool is_superset_of(const Candidates& other) const { return other.is_subset_of(*this); }
    bool intersects(const Candidates& other) const { return (mask_ & other.mask_) != 0; }

    Candidates operator|(const Candidates& other) const { return Candidates(static_cast<mask_type>(mask_ | other.mask_)); }
    Candidates operator&(const Candidates& other) const { return Candidates(static_cast<mask_type>(mask_ & other.mask_)); }
    Candidates& operator|=(const Candidates& other) { mask_ = static_cast<mask_type>(mask_ | other.mask_); return *this; }

    bool operator==(const Candidates& other) const { return mask_ == other.mask_; }
    bool operator!=(const Candidates& other) const { return mask_ != other.mask_; }

    /**
     * @brief 候補数字を昇順で取得
     */
    std::vector<digit_type> values() const;

    /**
     * @brief "{1,5,9}" 形式の文字列
     */
    std::string to_string() const;

private:
    mask_type mask_;
};

} // namespace sudoku_csp

#endif // SUDOKU_CSP_CANDIDATES_HPP
