#include "core/board.hpp"

#include <gtest/gtest.h>

namespace hoshi::gtest {

using enum Column;

static Move place(Column column, unsigned row, Color color) {
	return Place{.intersection = {column, row}, .color = color};
}

TEST(Board, NewBoard) {
	for (const std::size_t size: {9u, 13u, 19u}) {
		const Board board(size);
		EXPECT_EQ(board.size(), size);
		EXPECT_EQ(board.cellCount(), (size + 2u) * (size + 2u));
		EXPECT_EQ(board.sideToMove(), Color::Black);
		EXPECT_EQ(board.ko(), std::nullopt);
		EXPECT_EQ(board.lastMove(), std::nullopt);
		EXPECT_DOUBLE_EQ(board.komi(), 6.5);
		EXPECT_EQ(board.captures(Color::Black), 0u);
		EXPECT_EQ(board.captures(Color::White), 0u);
		EXPECT_EQ(board.moveNumber(), 0u);
		EXPECT_FALSE(board.hasStones());

		// Exactly the border ring is offboard.
		std::size_t offboard = 0;
		std::size_t empty    = 0;
		for (std::size_t i = 0; i != board.cellCount(); ++i) {
			if (board.get(i) == Board::State::Offboard) {
				++offboard;
			} else if (board.get(i) == Board::State::Empty) {
				++empty;
			}
		}
		EXPECT_EQ(empty, size * size);
		EXPECT_EQ(offboard, board.cellCount() - size * size);
	}
}

TEST(Board, PlayRegularMove) {
	Board board(19u);
	EXPECT_TRUE(board.play(Pass{}));
	EXPECT_TRUE(board.play(place(E, 4u, Color::Black)));

	EXPECT_EQ(board.get(Intersection{E, 4u}), Board::State::Black);
	EXPECT_EQ(board.lastMove(), place(E, 4u, Color::Black));
	EXPECT_EQ(board.sideToMove(), Color::White);
	EXPECT_EQ(board.moveNumber(), 2u);
}

TEST(Board, RejectsOutOfBounds) {
	Board board(9u);
	const auto before = board;

	EXPECT_FALSE(board.play(place(E, 0u, Color::Black)));  // Row too low
	EXPECT_FALSE(board.play(place(A, 10u, Color::Black))); // Row too high
	EXPECT_FALSE(board.play(place(K, 1u, Color::Black)));  // Column too high
	EXPECT_FALSE(board.play(place(O, 10u, Color::Black))); // Both too high
	EXPECT_EQ(board, before);
}

TEST(Board, RejectsOccupied) {
	Board board(9u);
	ASSERT_TRUE(board.play(place(E, 4u, Color::Black)));
	const auto before = board;

	EXPECT_FALSE(board.play(place(E, 4u, Color::Black)));
	EXPECT_FALSE(board.play(place(E, 4u, Color::White)));
	EXPECT_EQ(board, before);
}

TEST(Board, Resign) {
	Board board(9u);
	const auto before = board;
	EXPECT_FALSE(board.play(Resign{}));
	EXPECT_EQ(board, before);
}

TEST(Board, CaptureSingleStone) {
	Board board(19u);
	ASSERT_TRUE(board.play(place(D, 4u, Color::Black)));
	ASSERT_TRUE(board.play(place(D, 3u, Color::White)));
	ASSERT_TRUE(board.play(place(D, 5u, Color::White)));
	ASSERT_TRUE(board.play(place(C, 4u, Color::White)));
	ASSERT_TRUE(board.play(place(E, 4u, Color::White)));

	EXPECT_EQ(board.get(Intersection{D, 4u}), Board::State::Empty);
	EXPECT_EQ(board.captures(Color::White), 1u);
	EXPECT_EQ(board.captures(Color::Black), 0u);
	EXPECT_EQ(board.ko(), std::nullopt);
}

TEST(Board, CaptureGroupAtBorder) {
	Board board(9u);
	board.placeStone({A, 1u}, Color::White);
	board.placeStone({B, 1u}, Color::White);
	board.placeStone({A, 2u}, Color::Black);
	board.placeStone({B, 2u}, Color::Black);

	ASSERT_TRUE(board.play(place(C, 1u, Color::Black)));
	EXPECT_EQ(board.get(Intersection{A, 1u}), Board::State::Empty);
	EXPECT_EQ(board.get(Intersection{B, 1u}), Board::State::Empty);
	EXPECT_EQ(board.captures(Color::Black), 2u);
	EXPECT_EQ(board.ko(), std::nullopt); // Two stones never make a ko.
}

TEST(Board, Suicide) {
	Board board(9u);
	board.placeStone({A, 2u}, Color::Black);
	board.placeStone({B, 1u}, Color::Black);
	const auto before = board;

	EXPECT_FALSE(board.play(place(A, 1u, Color::White)));
	EXPECT_EQ(board, before);

	// Multi-stone suicide: filling the last liberty of an own group.
	Board surrounded(9u);
	surrounded.placeStone({A, 1u}, Color::White);
	surrounded.placeStone({A, 3u}, Color::Black);
	surrounded.placeStone({B, 2u}, Color::Black);
	surrounded.placeStone({B, 1u}, Color::Black);
	const auto beforeGroup = surrounded;

	EXPECT_FALSE(surrounded.play(place(A, 2u, Color::White)));
	EXPECT_EQ(surrounded, beforeGroup);
}

TEST(Board, CaptureBeforeSuicide) {
	Board board(9u);
	board.placeStone({A, 2u}, Color::Black);
	board.placeStone({B, 1u}, Color::Black);
	board.placeStone({B, 3u}, Color::Black);
	board.placeStone({C, 2u}, Color::Black);

	board.placeStone({C, 1u}, Color::White);
	board.placeStone({C, 3u}, Color::White);
	board.placeStone({D, 2u}, Color::White);

	// B2 has no liberties of its own but takes C2.
	EXPECT_TRUE(board.play(place(B, 2u, Color::White)));
	EXPECT_EQ(board.get(Intersection{C, 2u}), Board::State::Empty);
	EXPECT_EQ(board.captures(Color::White), 1u);

	// Immediate recapture is ko.
	EXPECT_EQ(board.ko(), (Intersection{C, 2u}));
	EXPECT_FALSE(board.play(place(C, 2u, Color::Black)));
}

TEST(Board, Ko) {
	Board board(9u);
	ASSERT_TRUE(board.play(place(E, 4u, Color::Black)));
	ASSERT_TRUE(board.play(place(F, 3u, Color::Black)));
	ASSERT_TRUE(board.play(place(G, 4u, Color::Black)));
	ASSERT_TRUE(board.play(place(F, 5u, Color::Black)));
	ASSERT_TRUE(board.play(place(E, 5u, Color::White)));
	ASSERT_TRUE(board.play(place(F, 6u, Color::White)));

	// Suicide for white before G5 is played.
	EXPECT_FALSE(board.play(place(F, 4u, Color::White)));
	ASSERT_TRUE(board.play(place(G, 5u, Color::White)));

	// Capture checks come before suicide.
	EXPECT_TRUE(board.play(place(F, 4u, Color::White)));
	EXPECT_EQ(board.captures(Color::White), 1u);
	EXPECT_EQ(board.ko(), (Intersection{F, 5u}));

	// Cannot retake in ko.
	const auto before = board;
	EXPECT_FALSE(board.play(place(F, 5u, Color::Black)));
	EXPECT_EQ(board, before);

	// Ko is lifted by a move elsewhere.
	ASSERT_TRUE(board.play(place(A, 1u, Color::Black)));
	EXPECT_EQ(board.ko(), std::nullopt);
	EXPECT_TRUE(board.play(place(F, 5u, Color::Black)));
	EXPECT_EQ(board.captures(Color::Black), 1u);
	EXPECT_EQ(board.ko(), (Intersection{F, 4u}));
}

TEST(Board, PassKeepsPosition) {
	Board board(9u);
	board.placeStone({A, 2u}, Color::Black);
	board.placeStone({B, 1u}, Color::Black);
	board.placeStone({B, 3u}, Color::Black);
	board.placeStone({C, 2u}, Color::Black);
	board.placeStone({C, 1u}, Color::White);
	board.placeStone({C, 3u}, Color::White);
	board.placeStone({D, 2u}, Color::White);
	ASSERT_TRUE(board.play(place(B, 2u, Color::White)));

	const auto before = board;
	EXPECT_TRUE(board.play(Pass{}));

	for (std::size_t i = 0; i != board.cellCount(); ++i) {
		EXPECT_EQ(board.get(i), before.get(i));
	}
	EXPECT_EQ(board.ko(), before.ko());
	EXPECT_EQ(board.lastMove(), before.lastMove());
	EXPECT_EQ(board.captures(Color::Black), before.captures(Color::Black));
	EXPECT_EQ(board.captures(Color::White), before.captures(Color::White));
	EXPECT_EQ(board.sideToMove(), opponent(before.sideToMove()));
	EXPECT_EQ(board.moveNumber(), before.moveNumber() + 1u);
}

TEST(Board, CopyIsIndependent) {
	Board board(19u);
	const auto copy = board;
	EXPECT_EQ(board, copy);

	ASSERT_TRUE(board.play(place(A, 1u, Color::White)));
	EXPECT_NE(board, copy);
	EXPECT_EQ(copy.get(Intersection{A, 1u}), Board::State::Empty);

	auto other = board;
	ASSERT_TRUE(other.play(place(B, 1u, Color::Black)));
	EXPECT_EQ(board.get(Intersection{B, 1u}), Board::State::Empty);
	EXPECT_EQ(board.moveNumber(), 1u);
}

TEST(Board, PlaceStone) {
	Board board(9u);
	EXPECT_TRUE(board.placeStone({E, 5u}, Color::White));
	EXPECT_FALSE(board.placeStone({E, 5u}, Color::Black));
	EXPECT_FALSE(board.placeStone({E, 10u}, Color::Black));

	EXPECT_EQ(board.get(Intersection{E, 5u}), Board::State::White);
	EXPECT_EQ(board.moveNumber(), 0u);
	EXPECT_EQ(board.sideToMove(), Color::Black);
}

TEST(Board, DiamondCorner) {
	Board board(19u);
	EXPECT_EQ(board.diamond(Intersection{A, 1u}), std::nullopt);
	board.placeStone({A, 2u}, Color::White);
	EXPECT_EQ(board.diamond(Intersection{A, 1u}), std::nullopt);
	board.placeStone({B, 1u}, Color::White);
	EXPECT_EQ(board.diamond(Intersection{A, 1u}), Color::White);
}

TEST(Board, DiamondSide) {
	Board board(19u);
	EXPECT_EQ(board.diamond(Intersection{E, 1u}), std::nullopt);
	board.placeStone({D, 1u}, Color::Black);
	EXPECT_EQ(board.diamond(Intersection{E, 1u}), std::nullopt);
	board.placeStone({E, 2u}, Color::Black);
	EXPECT_EQ(board.diamond(Intersection{E, 1u}), std::nullopt);
	board.placeStone({F, 1u}, Color::Black);
	EXPECT_EQ(board.diamond(Intersection{E, 1u}), Color::Black);
}

TEST(Board, DiamondCenter) {
	Board board(19u);
	board.placeStone({O, 14u}, Color::Black);
	board.placeStone({O, 12u}, Color::Black);
	board.placeStone({N, 13u}, Color::Black);
	EXPECT_EQ(board.diamond(Intersection{O, 13u}), std::nullopt);

	auto mixed = board;
	board.placeStone({P, 13u}, Color::Black);
	EXPECT_EQ(board.diamond(Intersection{O, 13u}), Color::Black);

	mixed.placeStone({P, 13u}, Color::White);
	EXPECT_EQ(mixed.diamond(Intersection{O, 13u}), std::nullopt);
}

TEST(Board, DiamondOffBoard) {
	const Board board(9u);
	EXPECT_EQ(board.diamond(Intersection{K, 1u}), std::nullopt);
	EXPECT_EQ(board.diamond(std::size_t{0}), std::nullopt);
}

TEST(Board, Render) {
	Board board(9u);
	ASSERT_TRUE(board.play(place(A, 1u, Color::Black)));
	ASSERT_TRUE(board.play(place(J, 9u, Color::White)));

	const auto diagram = board.render();
	EXPECT_EQ(diagram.rfind(" 9 . . . . . . . . O \n", 0), 0u);
	EXPECT_NE(diagram.find(" 1 X . . . . . . . . \n"), std::string::npos);
	EXPECT_NE(diagram.find("   A B C D E F G H J\n"), std::string::npos);
	EXPECT_NE(diagram.find("Komi:     6.5\n"), std::string::npos);
	EXPECT_NE(diagram.find("Ko:       None\n"), std::string::npos);
	EXPECT_NE(diagram.find("Captures: [B: 0, W: 0]\n"), std::string::npos);

	const Board large(19u);
	EXPECT_NE(large.render().find("19 . "), std::string::npos);
	EXPECT_NE(large.render().find("   A B C D E F G H J K L M N O P Q R S T\n"), std::string::npos);
}

} // namespace hoshi::gtest
