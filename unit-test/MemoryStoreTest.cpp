#include <thread>
#include "gtest/gtest.h"
#include "store/memory_store.hpp"

using namespace std;
using namespace arena::battle;
using namespace arena::store;

static room_state make_room(const string &id, const string &code, uint64_t version = 1) {
    room_state state;
    state.room.id = id;
    state.room.code = code;
    state.version = version;
    return state;
}

TEST(MemoryStoreTest, StoreAndLoad) {
    memory_room_store rooms;
    EXPECT_FALSE(rooms.load("a"));
    EXPECT_TRUE(rooms.store(make_room("a", "CODEA")));

    auto state = rooms.load("a");
    ASSERT_TRUE(state);
    EXPECT_EQ(state->room.code, "CODEA");
    EXPECT_EQ(rooms.find_by_code("CODEA"), optional<string>("a"));
    EXPECT_FALSE(rooms.find_by_code("CODEB"));
}

TEST(MemoryStoreTest, StaleVersionIsRejected) {
    memory_room_store rooms;
    EXPECT_TRUE(rooms.store(make_room("a", "CODEA", 5)));
    EXPECT_FALSE(rooms.store(make_room("a", "CODEA", 4)));
    EXPECT_TRUE(rooms.store(make_room("a", "CODEA", 6)));
    EXPECT_EQ(rooms.load("a")->version, 6u);
}

TEST(MemoryStoreTest, RestoreOnlyWhenAbsent) {
    memory_room_store rooms;
    EXPECT_TRUE(rooms.restore(make_room("a", "CODEA", 2)));
    EXPECT_FALSE(rooms.restore(make_room("a", "CODEA", 7)));
    EXPECT_EQ(rooms.load("a")->version, 2u);
}

TEST(MemoryStoreTest, EntriesExpire) {
    memory_room_store rooms(20);
    rooms.store(make_room("a", "CODEA"));
    EXPECT_TRUE(rooms.load("a"));
    this_thread::sleep_for(chrono::milliseconds(40));
    EXPECT_FALSE(rooms.load("a"));
    EXPECT_FALSE(rooms.find_by_code("CODEA"));
}

TEST(MemoryStoreTest, CapacityEvictsLeastRecentlyWritten) {
    memory_room_store rooms(0, 2);
    rooms.store(make_room("a", "CODEA"));
    this_thread::sleep_for(chrono::milliseconds(2));
    rooms.store(make_room("b", "CODEB"));
    this_thread::sleep_for(chrono::milliseconds(2));
    rooms.store(make_room("c", "CODEC"));

    EXPECT_EQ(rooms.size(), 2u);
    EXPECT_FALSE(rooms.load("a"));
    EXPECT_FALSE(rooms.find_by_code("CODEA"));
    EXPECT_TRUE(rooms.load("b"));
    EXPECT_TRUE(rooms.load("c"));
}

TEST(MemoryStoreTest, UnfinishedRoomsAreActiveOnly) {
    memory_room_store rooms;
    rooms.store(make_room("a", "CODEA"));
    room_state archived = make_room("b", "CODEB");
    archived.status = room_status::ARCHIVED;
    rooms.store(archived);

    auto unfinished = rooms.load_unfinished();
    ASSERT_EQ(unfinished.size(), 1u);
    EXPECT_EQ(unfinished[0].room.id, "a");

    rooms.remove("a");
    EXPECT_TRUE(rooms.load_unfinished().empty());
}

TEST(MemoryStoreTest, SubmissionsOrderedByTime) {
    memory_submission_store submissions;
    submission_record late, early, other;
    late.id = "late", late.room_id = "r", late.submitted_at = 20;
    early.id = "early", early.room_id = "r", early.submitted_at = 10;
    other.id = "other", other.room_id = "s", other.submitted_at = 5;
    submissions.add(late);
    submissions.add(early);
    submissions.add(other);

    auto list = submissions.list_by_room("r");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].id, "early");
    EXPECT_EQ(list[1].id, "late");
}

TEST(MemoryStoreTest, LeaderboardKeepsBestScore) {
    memory_leaderboard_store board;
    leaderboard_entry entry;
    entry.user_id = "alice";
    entry.category = "battle";
    entry.score = 80;
    EXPECT_TRUE(board.offer(entry));

    entry.score = 60;
    EXPECT_FALSE(board.offer(entry));
    entry.score = 80;
    EXPECT_FALSE(board.offer(entry));
    entry.score = 90;
    EXPECT_TRUE(board.offer(entry));

    entry.user_id = "bob";
    entry.score = 95;
    board.offer(entry);

    auto list = board.list("battle", 10);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].user_id, "bob");
    EXPECT_EQ(list[1].score, 90);
    EXPECT_EQ(board.list("battle", 1).size(), 1u);
    EXPECT_TRUE(board.list("speedrun", 10).empty());
}
