// src/chess/notation.cpp
#include "chessmancer/chess/notation.h"
#include "chessmancer/chess/board_state.h"
#include <cctype>
#include <sstream>

namespace chessmancer {
namespace chess {

namespace {

const char* OUTCOME_NAMES[] = {
    "in_progress",
    "checkmate",
    "stalemate",
    "draw_insufficient_material",
    "draw_fifty_move",
    "draw_repetition"
};

bool hasCastlingRight(const BoardState& board, int row, int rookCol, PieceColor color) {
    auto king = board.pieceAt({row, 4});
    auto rook = board.pieceAt({row, rookCol});
    return king && king->type == PieceType::KING && king->color == color && !king->has_moved &&
           rook && rook->type == PieceType::ROOK && rook->color == color && !rook->has_moved;
}

} // namespace

std::string squareToString(Square square) {
    if (!square.isValid()) {
        return "--";
    }
    std::string result;
    result += static_cast<char>('a' + square.col);
    result += static_cast<char>('0' + (BOARD_SIZE - square.row));
    return result;
}

std::optional<Square> stringToSquare(const std::string& text) {
    if (text.size() != 2) {
        return std::nullopt;
    }

    char file = static_cast<char>(std::tolower(static_cast<unsigned char>(text[0])));
    char rank = text[1];
    if (file < 'a' || file > 'h' || rank < '1' || rank > '8') {
        return std::nullopt;
    }

    return Square{BOARD_SIZE - (rank - '0'), file - 'a'};
}

std::string moveToString(const ChessMove& move) {
    return squareToString(move.from) + squareToString(move.to);
}

std::optional<ChessMove> stringToMove(const std::string& text) {
    if (text.size() != 4 && text.size() != 5) {
        return std::nullopt;
    }

    auto from = stringToSquare(text.substr(0, 2));
    auto to = stringToSquare(text.substr(2, 2));
    if (!from || !to) {
        return std::nullopt;
    }

    if (text.size() == 5 && std::string("qrbnQRBN").find(text[4]) == std::string::npos) {
        return std::nullopt;
    }

    return ChessMove{*from, *to};
}

char pieceToChar(const Piece& piece) {
    char c;
    switch (piece.type) {
        case PieceType::PAWN:   c = 'p'; break;
        case PieceType::KNIGHT: c = 'n'; break;
        case PieceType::BISHOP: c = 'b'; break;
        case PieceType::ROOK:   c = 'r'; break;
        case PieceType::QUEEN:  c = 'q'; break;
        case PieceType::KING:   c = 'k'; break;
        default:                return '.';
    }
    return piece.color == PieceColor::WHITE ? static_cast<char>(std::toupper(c)) : c;
}

std::string colorToString(PieceColor color) {
    switch (color) {
        case PieceColor::WHITE: return "white";
        case PieceColor::BLACK: return "black";
        default:                return "none";
    }
}

std::string outcomeToString(GameOutcome outcome) {
    return OUTCOME_NAMES[static_cast<int>(outcome)];
}

std::optional<GameOutcome> stringToOutcome(const std::string& text) {
    for (int i = 0; i <= static_cast<int>(GameOutcome::DRAW_REPETITION); ++i) {
        if (text == OUTCOME_NAMES[i]) {
            return static_cast<GameOutcome>(i);
        }
    }
    return std::nullopt;
}

std::string resultToString(const GameResult& result) {
    switch (result.outcome) {
        case GameOutcome::IN_PROGRESS:
            return "In progress";
        case GameOutcome::CHECKMATE:
            return "Checkmate, " + colorToString(result.winner) + " wins";
        case GameOutcome::STALEMATE:
            return "Stalemate";
        case GameOutcome::DRAW_INSUFFICIENT_MATERIAL:
            return "Draw by insufficient material";
        case GameOutcome::DRAW_FIFTY_MOVE:
            return "Draw by the fifty-move rule";
        case GameOutcome::DRAW_REPETITION:
            return "Draw by threefold repetition";
    }
    return "Unknown";
}

std::string toFEN(const BoardState& board) {
    std::stringstream ss;

    for (int row = 0; row < BOARD_SIZE; ++row) {
        int emptyCount = 0;
        for (int col = 0; col < BOARD_SIZE; ++col) {
            auto piece = board.pieceAt({row, col});
            if (!piece) {
                emptyCount++;
                continue;
            }
            if (emptyCount > 0) {
                ss << emptyCount;
                emptyCount = 0;
            }
            ss << pieceToChar(*piece);
        }
        if (emptyCount > 0) {
            ss << emptyCount;
        }
        if (row < BOARD_SIZE - 1) {
            ss << '/';
        }
    }

    ss << (board.turn() == PieceColor::WHITE ? " w " : " b ");

    std::string castling;
    if (hasCastlingRight(board, 7, 7, PieceColor::WHITE)) castling += 'K';
    if (hasCastlingRight(board, 7, 0, PieceColor::WHITE)) castling += 'Q';
    if (hasCastlingRight(board, 0, 7, PieceColor::BLACK)) castling += 'k';
    if (hasCastlingRight(board, 0, 0, PieceColor::BLACK)) castling += 'q';
    ss << (castling.empty() ? "-" : castling) << ' ';

    // The target is the square the double-advancing pawn skipped over
    auto advance = board.lastDoublePawnAdvance();
    auto advanced = advance ? board.pieceAt(*advance) : std::nullopt;
    if (advanced && advanced->type == PieceType::PAWN) {
        ss << squareToString({advance->row - pawnDirection(advanced->color), advance->col});
    } else {
        ss << '-';
    }

    ss << ' ' << board.halfmoveClock()
       << ' ' << board.fullmoveNumber();

    return ss.str();
}

} // namespace chess
} // namespace chessmancer
