#include "current_pointer.hpp"
#include "test_support.hpp"
#include <atomic>
#include <set>
#include <thread>

class CurrentPointerTest : public TempDirTest
{
  protected:
    void SetUp() override
    {
        TempDirTest::SetUp();
        themeA = path("themes/alpha");
        themeB = path("themes/beta");
        fs::create_directories(themeA);
        fs::create_directories(themeB);
        link = path("current/theme");
    }

    std::string themeA;
    std::string themeB;
    std::string link;
};

TEST_F(CurrentPointerTest, MissingSlotIsUnset)
{
    CurrentThemePointer pointer(link);
    PointerState state = pointer.read();
    EXPECT_EQ(state.status, PointerState::Status::Unset);
    EXPECT_TRUE(state.target.empty());
    EXPECT_EQ(state.error(), ErrorCode::None);
}

TEST_F(CurrentPointerTest, SetThenReadResolves)
{
    CurrentThemePointer pointer(link);
    ASSERT_TRUE(pointer.atomicSet(themeA).ok());

    PointerState state = pointer.read();
    EXPECT_TRUE(state.isResolved());
    EXPECT_EQ(state.target, themeA);
    EXPECT_EQ(state.themeId, "alpha");
    EXPECT_TRUE(fs::is_symlink(link));

    ASSERT_TRUE(pointer.atomicSet(themeB).ok());
    EXPECT_EQ(pointer.read().themeId, "beta");
}

TEST_F(CurrentPointerTest, SetLeavesNoTemporaryLinks)
{
    CurrentThemePointer pointer(link);
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(pointer.atomicSet(i % 2 ? themeA : themeB).ok());

    std::size_t entries = 0;
    for (const auto &entry : fs::directory_iterator(fs::path(link).parent_path()))
    {
        (void) entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(CurrentPointerTest, DeletedTargetReadsBroken)
{
    CurrentThemePointer pointer(link);
    ASSERT_TRUE(pointer.atomicSet(themeA).ok());
    fs::remove_all(themeA);

    PointerState state = pointer.read();
    EXPECT_EQ(state.status, PointerState::Status::Broken);
    EXPECT_EQ(state.error(), ErrorCode::BrokenPointer);
    EXPECT_EQ(state.themeId, "alpha");
    EXPECT_FALSE(state.message.empty());
}

TEST_F(CurrentPointerTest, RegularFileInSlotIsBrokenAndNotReplaced)
{
    writeFile(link, "not a link");
    CurrentThemePointer pointer(link);

    EXPECT_EQ(pointer.read().status, PointerState::Status::Broken);
    EXPECT_EQ(pointer.clear().error, ErrorCode::PointerWriteFailure);
    EXPECT_EQ(readFile(link), "not a link");
}

TEST_F(CurrentPointerTest, FailedWriteKeepsPreviousTarget)
{
    CurrentThemePointer pointer(link);
    ASSERT_TRUE(pointer.atomicSet(themeA).ok());

    PointerWriteResult result = pointer.atomicSet("");
    EXPECT_EQ(result.error, ErrorCode::PointerWriteFailure);
    EXPECT_FALSE(result.message.empty());

    PointerState state = pointer.read();
    EXPECT_TRUE(state.isResolved());
    EXPECT_EQ(state.target, themeA);

    // Nothing but the slot itself is left in the directory.
    std::size_t entries = 0;
    for (const auto &entry : fs::directory_iterator(fs::path(link).parent_path()))
    {
        (void) entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(CurrentPointerTest, DirectoryInSlotIsNotReplaced)
{
    writeFile(path("current/theme/keep"), "x");
    CurrentThemePointer pointer(link);

    EXPECT_EQ(pointer.atomicSet(themeB).error, ErrorCode::PointerWriteFailure);
    EXPECT_EQ(readFile(path("current/theme/keep")), "x");
    EXPECT_EQ(pointer.read().status, PointerState::Status::Broken);
}

TEST_F(CurrentPointerTest, UnwritableParentFails)
{
    writeFile(path("file-not-dir"), "");
    CurrentThemePointer pointer(path("file-not-dir/theme"));
    EXPECT_EQ(pointer.atomicSet(themeA).error, ErrorCode::PointerWriteFailure);
}

TEST_F(CurrentPointerTest, ClearRemovesLinkOnly)
{
    CurrentThemePointer pointer(link);
    EXPECT_TRUE(pointer.clear().ok());

    ASSERT_TRUE(pointer.atomicSet(themeA).ok());
    EXPECT_TRUE(pointer.clear().ok());
    EXPECT_EQ(pointer.read().status, PointerState::Status::Unset);
    EXPECT_TRUE(fs::is_directory(themeA));
}

TEST_F(CurrentPointerTest, ConcurrentReaderNeverSeesGap)
{
    CurrentThemePointer pointer(link);
    ASSERT_TRUE(pointer.atomicSet(themeA).ok());

    std::atomic<bool> done{false};
    std::set<std::string> seen;
    int unexpected = 0;

    std::thread reader([&] {
        CurrentThemePointer view(link);
        while (!done.load())
        {
            PointerState state = view.read();
            if (!state.isResolved())
                ++unexpected;
            else
                seen.insert(state.themeId);
        }
    });

    int failedWrites = 0;
    for (int i = 0; i < 500; ++i)
    {
        if (!pointer.atomicSet(i % 2 ? themeA : themeB).ok())
            ++failedWrites;
    }
    done = true;
    reader.join();

    EXPECT_EQ(failedWrites, 0);
    EXPECT_EQ(unexpected, 0);
    for (const auto &id : seen)
        EXPECT_TRUE(id == "alpha" || id == "beta") << id;
}
