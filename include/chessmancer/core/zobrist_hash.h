// include/chessmancer/core/zobrist_hash.h
#ifndef CHESSMANCER_ZOBRIST_HASH_H
#define CHESSMANCER_ZOBRIST_HASH_H

#include <vector>
#include <cstdint>
#include <random>

namespace chessmancer {
namespace core {

/**
 * @brief Zobrist hashing for board positions
 *
 * Random 64-bit keys for every (piece kind, square) pair, the side to move
 * and a small set of position features. XOR-ing the keys of everything
 * present yields a position key used for repetition detection.
 */
class ZobristHash {
public:
    /** Feature slots hashed in addition to pieces and side to move */
    enum Feature {
        CASTLING_RIGHTS = 0,   // values 0..15, one bit per castling right
        EN_PASSANT_FILE = 1,   // values 0..8, 8 meaning no target
        NUM_FEATURES
    };

    /**
     * @brief Constructor
     *
     * @param numSquares Number of squares on the board
     * @param numPieces Number of distinct piece kinds (kind x color)
     * @param seed Random seed, 0 to seed from the clock
     */
    ZobristHash(int numSquares, int numPieces, unsigned seed = 0);

    /**
     * @brief Get hash value for a piece on a square
     *
     * @param piece Piece kind index in [0, numPieces)
     * @param position Square index in [0, numSquares)
     * @return 64-bit hash value
     */
    uint64_t getPieceHash(int piece, int position) const;

    /**
     * @brief Get side-to-move hash
     *
     * @param player Player index (0 or 1)
     * @return 64-bit hash value for the player
     */
    uint64_t getPlayerHash(int player) const;

    /**
     * @brief Get feature hash
     *
     * @param featureIndex One of Feature
     * @param value Value of the feature
     * @return 64-bit hash value
     */
    uint64_t getFeatureHash(int featureIndex, int value) const;

    int getNumSquares() const { return numSquares_; }
    int getNumPieces() const { return numPieces_; }

private:
    int numSquares_;
    int numPieces_;

    std::vector<std::vector<uint64_t>> pieceHashes_;   // [piece][square]
    std::vector<uint64_t> playerHashes_;               // [player]
    std::vector<std::vector<uint64_t>> featureHashes_; // [feature][value]

    static uint64_t generateRandomHash(std::mt19937_64& rng);
};

} // namespace core
} // namespace chessmancer

#endif // CHESSMANCER_ZOBRIST_HASH_H
