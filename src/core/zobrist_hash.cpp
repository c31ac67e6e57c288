// src/core/zobrist_hash.cpp
#include "chessmancer/core/zobrist_hash.h"
#include <stdexcept>
#include <chrono>

namespace chessmancer {
namespace core {

namespace {
// Number of values each feature can take
const int FEATURE_SIZES[ZobristHash::NUM_FEATURES] = {16, 9};
}

ZobristHash::ZobristHash(int numSquares, int numPieces, unsigned seed)
    : numSquares_(numSquares), numPieces_(numPieces) {

    if (numSquares <= 0 || numPieces <= 0) {
        throw std::invalid_argument("ZobristHash needs at least one square and one piece kind");
    }

    unsigned actualSeed = seed != 0 ? seed :
        static_cast<unsigned>(std::chrono::system_clock::now().time_since_epoch().count());
    std::mt19937_64 rng(actualSeed);

    pieceHashes_.resize(numPieces);
    for (int p = 0; p < numPieces; ++p) {
        pieceHashes_[p].resize(numSquares);
        for (int pos = 0; pos < numSquares; ++pos) {
            pieceHashes_[p][pos] = generateRandomHash(rng);
        }
    }

    playerHashes_.resize(2);
    for (auto& h : playerHashes_) {
        h = generateRandomHash(rng);
    }

    featureHashes_.resize(NUM_FEATURES);
    for (int f = 0; f < NUM_FEATURES; ++f) {
        featureHashes_[f].resize(FEATURE_SIZES[f]);
        for (auto& h : featureHashes_[f]) {
            h = generateRandomHash(rng);
        }
    }
}

uint64_t ZobristHash::getPieceHash(int piece, int position) const {
    if (piece < 0 || piece >= numPieces_ ||
        position < 0 || position >= numSquares_) {
        throw std::out_of_range("Piece or position index out of range");
    }
    return pieceHashes_[piece][position];
}

uint64_t ZobristHash::getPlayerHash(int player) const {
    if (player < 0 || player >= static_cast<int>(playerHashes_.size())) {
        throw std::out_of_range("Player index out of range");
    }
    return playerHashes_[player];
}

uint64_t ZobristHash::getFeatureHash(int featureIndex, int value) const {
    if (featureIndex < 0 || featureIndex >= NUM_FEATURES) {
        throw std::out_of_range("Feature index out of range");
    }
    const auto& values = featureHashes_[featureIndex];
    if (value < 0 || value >= static_cast<int>(values.size())) {
        throw std::out_of_range("Feature value out of range");
    }
    return values[value];
}

uint64_t ZobristHash::generateRandomHash(std::mt19937_64& rng) {
    return rng();
}

} // namespace core
} // namespace chessmancer
