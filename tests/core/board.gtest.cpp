#include "core/board.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace clockgo::gtest {

namespace {

//! Stones of the grid and groups of the table describe the same position. No group is without liberty.
void expectConsistent(const Board& board) {
	for (const auto& [id, group]: board.groups()) {
		EXPECT_GT(group.libertyCount(), 0u);
		for (const auto s: group.stones()) {
			const auto stone = board.at(s);
			ASSERT_TRUE(stone.has_value());
			EXPECT_EQ(stone->group, id);
		}
		for (const auto liberty: group.liberties()) {
			EXPECT_TRUE(board.isEmpty(liberty));
		}
	}

	const auto size = static_cast<Id>(board.size());
	for (Id x = 1u; x <= size; ++x) {
		for (Id y = 1u; y <= size; ++y) {
			if (const auto stone = board.at({x, y})) {
				ASSERT_TRUE(board.groups().contains(stone->group));
				EXPECT_TRUE(board.groups().at(stone->group).hasStone({x, y}));
			}
		}
	}
}

} // namespace

TEST(Board, Default) {
	Board board;
	EXPECT_EQ(board.size(), DEFAULT_BOARD_SIZE);
	EXPECT_TRUE(board.groups().empty());
	EXPECT_TRUE(board.history().empty());
	EXPECT_EQ(board.deadStones(), DeadStones{});
	EXPECT_FALSE(board.ko().has_value());
}

TEST(Board, PlaceStone) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	EXPECT_TRUE(board.play(Player::Black, {3u, 3u}));
	const auto stone = board.at({3u, 3u});
	ASSERT_TRUE(stone.has_value());
	EXPECT_EQ(stone->player, Player::Black);
	EXPECT_EQ(board.groups().size(), 1u);
	EXPECT_EQ(board.history().size(), 1u);
	EXPECT_EQ(board.history().back().player, Player::Black);
	EXPECT_EQ(board.history().back().action, (Action{PutAction{{3u, 3u}}}));
	expectConsistent(board);
}

TEST(Board, RejectOccupied) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	EXPECT_TRUE(board.play(Player::Black, {3u, 3u}));
	EXPECT_FALSE(board.play(Player::Black, {3u, 3u}));
	EXPECT_FALSE(board.play(Player::White, {3u, 3u}));
	EXPECT_EQ(board.at({3u, 3u})->player, Player::Black);
	EXPECT_EQ(board.history().size(), 1u);
}

TEST(Board, RejectOffBoard) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	EXPECT_FALSE(board.play(Player::Black, {0u, 1u}));
	EXPECT_FALSE(board.play(Player::Black, {1u, 0u}));
	EXPECT_FALSE(board.play(Player::Black, {6u, 1u}));
	EXPECT_FALSE(board.play(Player::Black, {1u, 6u}));
	EXPECT_TRUE(board.history().empty());
}

TEST(Board, Liberties) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	EXPECT_TRUE(board.libertiesOf({3u, 3u}).empty());
	EXPECT_EQ(board.groupAt({3u, 3u}), nullptr);

	EXPECT_TRUE(board.play(Player::Black, {3u, 3u}));
	EXPECT_EQ(board.libertiesOf({3u, 3u}).size(), 4u);

	EXPECT_TRUE(board.play(Player::White, {3u, 4u}));
	EXPECT_EQ(board.libertiesOf({3u, 3u}), (std::vector<Coord>{{2u, 3u}, {3u, 2u}, {4u, 3u}}));
	EXPECT_EQ(board.libertiesOf({3u, 4u}), (std::vector<Coord>{{2u, 4u}, {3u, 5u}, {4u, 4u}}));

	// Corner stone
	EXPECT_TRUE(board.play(Player::Black, {1u, 1u}));
	EXPECT_EQ(board.libertiesOf({1u, 1u}), (std::vector<Coord>{{1u, 2u}, {2u, 1u}}));
	expectConsistent(board);
}

TEST(Board, CaptureSingleStone) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	EXPECT_TRUE(board.play(Player::White, {2u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {2u, 1u}));
	EXPECT_TRUE(board.play(Player::Black, {1u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {3u, 2u}));
	EXPECT_EQ(board.libertiesOf({2u, 2u}), (std::vector<Coord>{{2u, 3u}}));

	EXPECT_TRUE(board.play(Player::Black, {2u, 3u}));
	EXPECT_TRUE(board.isEmpty({2u, 2u}));
	EXPECT_EQ(board.deadStones().white, 1u);
	EXPECT_EQ(board.deadStones().black, 0u);
	EXPECT_EQ(board.groups().size(), 4u);
	ASSERT_EQ(board.history().back().captured.size(), 1u);
	EXPECT_TRUE(board.history().back().captured.front().hasStone({2u, 2u}));

	// The freed point is a liberty of all surrounding stones again.
	for (const Coord c: {Coord{2u, 1u}, Coord{1u, 2u}, Coord{3u, 2u}, Coord{2u, 3u}}) {
		EXPECT_TRUE(board.groupAt(c)->hasLiberty({2u, 2u}));
	}
	expectConsistent(board);
}

TEST(Board, CaptureGroup) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	// White chain along the lower edge
	EXPECT_TRUE(board.play(Player::White, {1u, 1u}));
	EXPECT_TRUE(board.play(Player::White, {2u, 1u}));
	EXPECT_TRUE(board.play(Player::White, {3u, 1u}));

	EXPECT_TRUE(board.play(Player::Black, {1u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {2u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {3u, 2u}));
	EXPECT_EQ(board.libertiesOf({1u, 1u}), (std::vector<Coord>{{4u, 1u}}));

	EXPECT_TRUE(board.play(Player::Black, {4u, 1u}));
	EXPECT_TRUE(board.isEmpty({1u, 1u}));
	EXPECT_TRUE(board.isEmpty({2u, 1u}));
	EXPECT_TRUE(board.isEmpty({3u, 1u}));
	EXPECT_EQ(board.deadStones().white, 3u);
	EXPECT_FALSE(board.ko().has_value());
	expectConsistent(board);
}

TEST(Board, CaptureTwoGroupsAtOnce) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	// White stones at (1,1) and (3,1) share their last liberty (2,1).
	EXPECT_TRUE(board.play(Player::White, {1u, 1u}));
	EXPECT_TRUE(board.play(Player::White, {3u, 1u}));
	EXPECT_TRUE(board.play(Player::Black, {1u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {3u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {4u, 1u}));

	EXPECT_TRUE(board.play(Player::Black, {2u, 1u}));
	EXPECT_TRUE(board.isEmpty({1u, 1u}));
	EXPECT_TRUE(board.isEmpty({3u, 1u}));
	EXPECT_EQ(board.deadStones().white, 2u);
	EXPECT_EQ(board.history().back().captured.size(), 2u);
	expectConsistent(board);
}

TEST(Board, RejectSuicide) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	EXPECT_TRUE(board.play(Player::Black, {1u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {2u, 1u}));

	const auto grid    = board.grid();
	const auto groups  = board.groups();
	const auto history = board.history().size();

	EXPECT_FALSE(board.play(Player::White, {1u, 1u}));
	EXPECT_EQ(board.grid(), grid);
	EXPECT_EQ(board.groups(), groups);
	EXPECT_EQ(board.history().size(), history);
	EXPECT_EQ(board.deadStones(), DeadStones{});

	// Own stones may fill the point.
	EXPECT_TRUE(board.play(Player::Black, {1u, 1u}));
	expectConsistent(board);
}

TEST(Board, RejectGroupSuicide) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	EXPECT_TRUE(board.play(Player::Black, {1u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {2u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {3u, 1u}));
	EXPECT_TRUE(board.play(Player::White, {2u, 1u}));

	const auto grid   = board.grid();
	const auto groups = board.groups();

	// Filling the last liberty of the own group without capturing.
	EXPECT_FALSE(board.play(Player::White, {1u, 1u}));
	EXPECT_EQ(board.grid(), grid);
	EXPECT_EQ(board.groups(), groups);
	EXPECT_TRUE(board.groupAt({1u, 2u})->hasLiberty({1u, 1u}));
	expectConsistent(board);
}

TEST(Board, SuicideOnSingleIntersection) {
	Board board;
	ASSERT_TRUE(board.resize(1u));

	EXPECT_FALSE(board.play(Player::Black, {1u, 1u}));
	EXPECT_TRUE(board.isEmpty({1u, 1u}));
}

TEST(Board, CaptureBeforeSuicide) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	// White (1,1) has the only liberty (2,1). Black (2,1) has no empty neighbour but captures.
	EXPECT_TRUE(board.play(Player::White, {1u, 1u}));
	EXPECT_TRUE(board.play(Player::Black, {1u, 2u}));
	EXPECT_TRUE(board.play(Player::White, {2u, 2u}));
	EXPECT_TRUE(board.play(Player::White, {3u, 1u}));

	EXPECT_TRUE(board.play(Player::Black, {2u, 1u}));
	EXPECT_TRUE(board.isEmpty({1u, 1u}));
	EXPECT_EQ(board.libertiesOf({2u, 1u}), (std::vector<Coord>{{1u, 1u}}));
	expectConsistent(board);
}

TEST(Board, MergeGroups) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	EXPECT_TRUE(board.play(Player::Black, {1u, 1u}));
	EXPECT_TRUE(board.play(Player::Black, {1u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {3u, 1u}));
	EXPECT_EQ(board.groups().size(), 2u);

	// The larger group keeps its id.
	const auto larger = board.at({1u, 1u})->group;
	EXPECT_EQ(board.at({1u, 2u})->group, larger);

	EXPECT_TRUE(board.play(Player::Black, {2u, 1u}));
	EXPECT_EQ(board.groups().size(), 1u);
	for (const Coord c: {Coord{1u, 1u}, Coord{1u, 2u}, Coord{2u, 1u}, Coord{3u, 1u}}) {
		EXPECT_EQ(board.at(c)->group, larger);
	}
	EXPECT_EQ(board.groupAt({3u, 1u})->stoneCount(), 4u);
	EXPECT_EQ(board.libertiesOf({3u, 1u}), (std::vector<Coord>{{1u, 3u}, {2u, 2u}, {3u, 2u}, {4u, 1u}}));
	expectConsistent(board);
}

TEST(Board, NoGroupWithoutLiberty) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	// Alternate along a fixed pattern. Rejected plays are fine, the position must stay consistent.
	auto player = Player::Black;
	for (Id i = 0u; i < 25u; ++i) {
		const Coord c{(i * 7u) % 5u + 1u, (i * 3u) % 5u + 1u};
		if (board.play(player, c)) {
			player = opponent(player);
		}
		expectConsistent(board);
	}
}

TEST(Board, Pass) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	EXPECT_TRUE(board.play(Player::Black, {3u, 3u}));
	const auto grid = board.grid();

	board.pass(Player::White);
	EXPECT_EQ(board.grid(), grid);
	ASSERT_EQ(board.history().size(), 2u);
	EXPECT_EQ(board.history().back().player, Player::White);
	EXPECT_TRUE(std::holds_alternative<PassAction>(board.history().back().action));
}

TEST(Board, Resize) {
	Board board;
	ASSERT_TRUE(board.resize(5u));
	EXPECT_TRUE(board.play(Player::Black, {3u, 3u}));

	EXPECT_FALSE(board.resize(0u));
	EXPECT_FALSE(board.resize(MAX_BOARD_SIZE + 1u));
	EXPECT_EQ(board.size(), 5u);
	EXPECT_FALSE(board.isEmpty({3u, 3u}));
	EXPECT_EQ(board.history().size(), 1u);

	EXPECT_TRUE(board.resize(9u));
	EXPECT_EQ(board.size(), 9u);
	EXPECT_TRUE(board.isEmpty({3u, 3u}));
	EXPECT_TRUE(board.groups().empty());
	EXPECT_TRUE(board.history().empty());

	EXPECT_TRUE(board.resize(MAX_BOARD_SIZE));
	EXPECT_TRUE(board.play(Player::Black, {25u, 25u}));
}

TEST(Board, Clear) {
	Board board;
	ASSERT_TRUE(board.resize(5u));

	EXPECT_TRUE(board.play(Player::White, {2u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {2u, 1u}));
	EXPECT_TRUE(board.play(Player::Black, {1u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {3u, 2u}));
	EXPECT_TRUE(board.play(Player::Black, {2u, 3u}));

	board.clear();
	EXPECT_EQ(board.size(), 5u);
	EXPECT_EQ(board.grid(), Grid{});
	EXPECT_TRUE(board.groups().empty());
	EXPECT_TRUE(board.history().empty());
	EXPECT_EQ(board.deadStones(), DeadStones{});
	EXPECT_FALSE(board.ko().has_value());
	EXPECT_FALSE(board.undo());
}

} // namespace clockgo::gtest
