// src/chess/board_state.cpp
#include "chessmancer/chess/board_state.h"
#include "chessmancer/chess/attacks.h"
#include "chessmancer/chess/notation.h"
#include "chessmancer/core/errors.h"
#include "chessmancer/core/zobrist_hash.h"
#include <cstdlib>
#include <sstream>

namespace chessmancer {
namespace chess {

namespace {

// Fixed seed so that equal positions hash equally across boards and runs
const unsigned ZOBRIST_SEED = 0x5eed1234u;

const core::ZobristHash& zobrist() {
    static const core::ZobristHash instance(NUM_SQUARES, 12, ZOBRIST_SEED);
    return instance;
}

int zobristPieceIndex(const Piece& piece) {
    int kind = static_cast<int>(piece.type) - static_cast<int>(PieceType::PAWN);
    return piece.color == PieceColor::WHITE ? kind : kind + 6;
}

bool isUnmoved(const Piece& piece, PieceType type, PieceColor color) {
    return piece.type == type && piece.color == color && !piece.has_moved;
}

const PieceType BACK_RANK[BOARD_SIZE] = {
    PieceType::ROOK, PieceType::KNIGHT, PieceType::BISHOP, PieceType::QUEEN,
    PieceType::KING, PieceType::BISHOP, PieceType::KNIGHT, PieceType::ROOK
};

} // namespace

BoardState::BoardState()
    : turn_(PieceColor::WHITE),
      halfmoveClock_(0),
      fullmoveNumber_(1) {
    initializeStartingPosition();
    restartPositionKeys();
}

BoardState BoardState::standard() {
    return BoardState();
}

BoardState BoardState::empty() {
    BoardState board;
    board.grid_.fill(Piece());
    board.restartPositionKeys();
    return board;
}

void BoardState::initializeStartingPosition() {
    grid_.fill(Piece());

    for (int col = 0; col < BOARD_SIZE; ++col) {
        at({6, col}) = {PieceType::PAWN, PieceColor::WHITE, false};
        at({1, col}) = {PieceType::PAWN, PieceColor::BLACK, false};
        at({7, col}) = {BACK_RANK[col], PieceColor::WHITE, false};
        at({0, col}) = {BACK_RANK[col], PieceColor::BLACK, false};
    }
}

std::optional<Piece> BoardState::pieceAt(Square square) const {
    if (!square.isValid()) {
        return std::nullopt;
    }
    const Piece& piece = at(square);
    if (piece.is_empty()) {
        return std::nullopt;
    }
    return piece;
}

void BoardState::applyMove(Square from, Square to) {
    // All checks happen before the first write so a rejected move leaves
    // the board untouched.
    if (!from.isValid() || !to.isValid()) {
        throw core::InvariantViolation("move " + moveToString({from, to}) + " leaves the board");
    }

    Piece moving = at(from);
    if (moving.is_empty()) {
        throw core::InvariantViolation("no piece on " + squareToString(from));
    }

    const bool isCastling = moving.type == PieceType::KING &&
                            std::abs(to.col - from.col) == 2 &&
                            !moving.has_moved;
    Square rookFrom{from.row, to.col > from.col ? BOARD_SIZE - 1 : 0};
    Square rookTo{from.row, to.col > from.col ? to.col - 1 : to.col + 1};
    if (isCastling) {
        const Piece& rook = at(rookFrom);
        if (rook.type != PieceType::ROOK || rook.color != moving.color) {
            throw core::InvariantViolation("castling without a rook on " + squareToString(rookFrom));
        }
    }

    const bool isPawn = moving.type == PieceType::PAWN;
    const bool isEnPassant = isPawn && from.col != to.col && at(to).is_empty();
    const bool isCapture = !at(to).is_empty() || isEnPassant;
    const int promotionRow = moving.color == PieceColor::WHITE ? 0 : BOARD_SIZE - 1;

    if (isCastling) {
        Piece rook = at(rookFrom);
        rook.has_moved = true;
        at(rookFrom) = Piece();
        at(rookTo) = rook;
    }

    if (isEnPassant) {
        at({from.row, to.col}) = Piece();
    }

    if (isPawn && to.row == promotionRow) {
        moving.type = PieceType::QUEEN;
    }

    moving.has_moved = true;
    at(from) = Piece();
    at(to) = moving;

    if (isPawn && std::abs(to.row - from.row) == 2) {
        lastDoublePawnAdvance_ = to;
    } else {
        lastDoublePawnAdvance_.reset();
    }

    moveHistory_.push_back({from, to});
    if (turn_ == PieceColor::BLACK) {
        fullmoveNumber_++;
    }
    turn_ = oppositeColor(turn_);

    halfmoveClock_ = (isPawn || isCapture) ? 0 : halfmoveClock_ + 1;
    positionKeys_.push_back(computeHash());
}

void BoardState::placePiece(Square square, PieceType type, PieceColor color, bool hasMoved) {
    if (!square.isValid()) {
        throw core::InvariantViolation("cannot place a piece off the board");
    }
    at(square) = {type, color, hasMoved};
    restartPositionKeys();
}

void BoardState::removePiece(Square square) {
    if (!square.isValid()) {
        throw core::InvariantViolation("cannot remove a piece off the board");
    }
    at(square) = Piece();
    restartPositionKeys();
}

void BoardState::setTurn(PieceColor color) {
    turn_ = color;
    restartPositionKeys();
}

void BoardState::setLastDoublePawnAdvance(std::optional<Square> square) {
    lastDoublePawnAdvance_ = square;
    restartPositionKeys();
}

void BoardState::setHalfmoveClock(int clock) {
    halfmoveClock_ = clock;
}

void BoardState::setFullmoveNumber(int number) {
    fullmoveNumber_ = number;
}

std::optional<Square> BoardState::findKing(PieceColor color) const {
    return chess::findKing(grid_, color);
}

void BoardState::validate() const {
    int whiteKings = 0;
    int blackKings = 0;
    for (const Piece& piece : grid_) {
        if (piece.is_empty()) {
            continue;
        }
        if (piece.color == PieceColor::NONE) {
            throw core::InvariantViolation("piece without a color on the board");
        }
        if (piece.type == PieceType::KING) {
            (piece.color == PieceColor::WHITE ? whiteKings : blackKings)++;
        }
    }

    if (whiteKings != 1 || blackKings != 1) {
        std::ostringstream ss;
        ss << "expected one king per color, found " << whiteKings
           << " white and " << blackKings << " black";
        throw core::InvariantViolation(ss.str());
    }
}

uint64_t BoardState::computeHash() const {
    const core::ZobristHash& keys = zobrist();
    uint64_t hash = 0;

    for (int i = 0; i < NUM_SQUARES; ++i) {
        if (!grid_[i].is_empty()) {
            hash ^= keys.getPieceHash(zobristPieceIndex(grid_[i]), i);
        }
    }

    hash ^= keys.getPlayerHash(turn_ == PieceColor::WHITE ? 0 : 1);

    int castling = 0;
    if (isUnmoved(at({7, 4}), PieceType::KING, PieceColor::WHITE)) {
        if (isUnmoved(at({7, 7}), PieceType::ROOK, PieceColor::WHITE)) castling |= 1;
        if (isUnmoved(at({7, 0}), PieceType::ROOK, PieceColor::WHITE)) castling |= 2;
    }
    if (isUnmoved(at({0, 4}), PieceType::KING, PieceColor::BLACK)) {
        if (isUnmoved(at({0, 7}), PieceType::ROOK, PieceColor::BLACK)) castling |= 4;
        if (isUnmoved(at({0, 0}), PieceType::ROOK, PieceColor::BLACK)) castling |= 8;
    }
    hash ^= keys.getFeatureHash(core::ZobristHash::CASTLING_RIGHTS, castling);

    int epFile = hasEnPassantCapture() ? lastDoublePawnAdvance_->col : BOARD_SIZE;
    hash ^= keys.getFeatureHash(core::ZobristHash::EN_PASSANT_FILE, epFile);

    return hash;
}

bool BoardState::hasEnPassantCapture() const {
    if (!lastDoublePawnAdvance_ || !lastDoublePawnAdvance_->isValid()) {
        return false;
    }

    const Square advanced = *lastDoublePawnAdvance_;
    for (int side : {-1, 1}) {
        Square beside{advanced.row, advanced.col + side};
        if (beside.isValid() && at(beside).type == PieceType::PAWN && at(beside).color == turn_) {
            return true;
        }
    }
    return false;
}

void BoardState::restartPositionKeys() {
    positionKeys_.assign(1, computeHash());
}

std::string BoardState::toString() const {
    std::stringstream ss;

    ss << "  a b c d e f g h" << std::endl;
    for (int row = 0; row < BOARD_SIZE; ++row) {
        ss << (BOARD_SIZE - row) << " ";
        for (int col = 0; col < BOARD_SIZE; ++col) {
            const Piece& piece = at({row, col});
            ss << (piece.is_empty() ? '.' : pieceToChar(piece)) << " ";
        }
        ss << (BOARD_SIZE - row) << std::endl;
    }
    ss << "  a b c d e f g h" << std::endl;
    ss << (turn_ == PieceColor::WHITE ? "White" : "Black") << " to move";

    return ss.str();
}

} // namespace chess
} // namespace chessmancer
