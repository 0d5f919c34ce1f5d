#include <gtest/gtest.h>
#include "TempDir.hpp"
#include "library/Library.hpp"
#include "library/errors.hpp"

#include <algorithm>
#include <iterator>
#include <set>

using namespace po::library;
namespace fs = std::filesystem;

class LibraryTest : public po::test::TempDirTest {
protected:
    fs::path inbox, output;

    void SetUp() override {
        TempDirTest::SetUp();
        inbox = root / "inbox";
        output = root / "library";
        fs::create_directories(inbox);
        fs::create_directories(output);
    }

    static std::vector<fs::path> pathsOf(const std::vector<UnsortedFile>& files) {
        std::vector<fs::path> out;
        for (const auto& f : files) out.push_back(f.path);
        return out;
    }
};

TEST_F(LibraryTest, NewOutputRootLoadsEmpty) {
    const auto lib = Library::load(output);
    EXPECT_TRUE(lib.entries().empty());
    EXPECT_EQ(lib.metaRoot(), output / "_pometa");
    EXPECT_TRUE(fs::exists(output / "_pometa" / "hashes"));
}

TEST_F(LibraryTest, ImportMoveToRootThenReload) {
    const auto fileA = writeFile(inbox / "IMG_0001.jpg", "sunset");
    const auto hashA = ContentHash::compute(fileA);

    auto lib = Library::load(output);
    const auto fresh = lib.checkNew({fileA});
    ASSERT_EQ(fresh.size(), 1u);
    EXPECT_EQ(fresh[0].path, fileA);
    EXPECT_EQ(fresh[0].hash, hashA);

    lib.place(fresh, SortPolicy::MoveToRoot);
    EXPECT_FALSE(fs::exists(fileA));
    EXPECT_EQ(readFile(output / "IMG_0001.jpg"), "sunset");
    lib.persist();

    const auto reloaded = Library::load(output);
    ASSERT_EQ(reloaded.entries().size(), 1u);
    EXPECT_EQ(reloaded.entries()[0].hash, hashA);
    EXPECT_EQ(reloaded.entries()[0].relPathString(), "IMG_0001.jpg");
    EXPECT_TRUE(reloaded.contains(hashA));
}

TEST_F(LibraryTest, KnownContentUnderAnotherNameIsSkipped) {
    const auto fileA = writeFile(inbox / "a.jpg", "same bytes");
    {
        auto lib = Library::load(output);
        lib.place(lib.checkNew({fileA}), SortPolicy::MoveToRoot);
        lib.persist();
    }

    const auto copy = writeFile(inbox / "copy_of_a.jpg", "same bytes");
    auto lib = Library::load(output);
    EXPECT_TRUE(lib.checkNew({copy}).empty());
    EXPECT_TRUE(fs::exists(copy));
    EXPECT_FALSE(fs::exists(output / "copy_of_a.jpg"));
    EXPECT_EQ(lib.size(), 1u);
}

TEST_F(LibraryTest, CheckNewMixesKnownAndNew) {
    const auto known = writeFile(inbox / "known.jpg", "old");
    {
        auto lib = Library::load(output);
        lib.place(lib.checkNew({known}), SortPolicy::MoveToRoot);
        lib.persist();
    }

    const auto again = writeFile(inbox / "again.jpg", "old");
    const auto fresh = writeFile(inbox / "fresh.jpg", "new");
    const auto lib = Library::load(output);
    EXPECT_EQ(pathsOf(lib.checkNew({again, fresh})), std::vector<fs::path>{fresh});
}

TEST_F(LibraryTest, DuplicateContentWithinBatchReturnedOnce) {
    const auto a = writeFile(inbox / "a.jpg", "twin");
    const auto b = writeFile(inbox / "b.jpg", "twin");
    const auto c = writeFile(inbox / "c.jpg", "other");

    auto lib = Library::load(output);
    const auto fresh = lib.checkNew({a, b, c});
    EXPECT_EQ(pathsOf(fresh), (std::vector<fs::path>{a, c}));

    lib.place(fresh, SortPolicy::MoveToRoot);
    EXPECT_EQ(lib.size(), 2u);
    EXPECT_TRUE(fs::exists(b));
}

TEST_F(LibraryTest, CheckNewDoesNotTouchTheIndex) {
    const auto a = writeFile(inbox / "a.jpg", "x");
    const auto lib = Library::load(output);
    (void)lib.checkNew({a});
    (void)lib.checkNew({a});
    EXPECT_TRUE(lib.entries().empty());
    EXPECT_TRUE(fs::exists(a));
}

TEST_F(LibraryTest, CheckNewPropagatesUnreadableCandidate) {
    const auto lib = Library::load(output);
    EXPECT_THROW((void)lib.checkNew({inbox / "missing.jpg"}), IOError);
}

TEST_F(LibraryTest, NoDuplicateHashesAfterRepeatedPlacement) {
    auto lib = Library::load(output);
    for (int round = 0; round < 3; ++round) {
        std::vector<fs::path> batch;
        for (int i = 0; i < 4; ++i)
            batch.push_back(writeFile(inbox / ("r" + std::to_string(round) + "_" + std::to_string(i) + ".jpg"),
                                      "content " + std::to_string(i % 3 + round)));
        lib.place(lib.checkNew(batch), SortPolicy::MoveToRoot);
    }

    std::set<ContentHash> seen;
    for (const auto& e : lib.entries()) EXPECT_TRUE(seen.insert(e.hash).second) << e.relPathString();
    EXPECT_EQ(lib.size(), 5u); // contents 0..4
}

TEST_F(LibraryTest, PlaceSkipsContentAlreadyRecorded) {
    const auto a = writeFile(inbox / "a.jpg", "dup");
    auto lib = Library::load(output);
    const auto fresh = lib.checkNew({a});
    lib.place(fresh, SortPolicy::MoveToRoot);

    const auto b = writeFile(inbox / "b.jpg", "dup");
    lib.place({UnsortedFile{b, fresh[0].hash}}, SortPolicy::MoveToRoot);
    EXPECT_EQ(lib.size(), 1u);
    EXPECT_TRUE(fs::exists(b));
}

TEST_F(LibraryTest, NameCollisionFailsWithoutOverwriting) {
    writeFile(output / "IMG_0001.jpg", "already here");
    const auto incoming = writeFile(inbox / "IMG_0001.jpg", "different photo");

    auto lib = Library::load(output);
    const auto fresh = lib.checkNew({incoming});
    ASSERT_EQ(fresh.size(), 1u);

    EXPECT_THROW(lib.place(fresh, SortPolicy::MoveToRoot), DestinationExistsError);
    EXPECT_EQ(readFile(output / "IMG_0001.jpg"), "already here");
    EXPECT_EQ(readFile(incoming), "different photo");
    EXPECT_TRUE(lib.entries().empty());
}

TEST_F(LibraryTest, FailureMidBatchKeepsEarlierPlacements) {
    const auto first = writeFile(inbox / "first.jpg", "1");
    const auto second = writeFile(inbox / "second.jpg", "2");
    const auto third = writeFile(inbox / "third.jpg", "3");

    auto lib = Library::load(output);
    const auto fresh = lib.checkNew({first, second, third});
    ASSERT_EQ(fresh.size(), 3u);

    fs::remove(second); // vanishes between hashing and placement
    EXPECT_THROW(lib.place(fresh, SortPolicy::MoveToRoot), IOError);

    ASSERT_EQ(lib.size(), 1u);
    EXPECT_EQ(lib.entries()[0].relPathString(), "first.jpg");
    EXPECT_TRUE(fs::exists(output / "first.jpg"));
    EXPECT_TRUE(fs::exists(third));

    // nothing was persisted yet
    EXPECT_TRUE(Library::load(output).entries().empty());
}

TEST_F(LibraryTest, PersistLoadRoundTripIsOrderIndependentEqual) {
    auto lib = Library::load(output);
    lib.place(lib.checkNew({writeFile(inbox / "b.jpg", "b"), writeFile(inbox / "a b.jpg", "a")}),
              SortPolicy::MoveToRoot);
    lib.persist();

    auto expected = lib.entries();
    auto loaded = Library::load(output).entries();
    const auto byPath = [](const Entry& l, const Entry& r) { return l.relPathString() < r.relPathString(); };
    std::ranges::sort(expected, byPath);
    std::ranges::sort(loaded, byPath);
    EXPECT_EQ(loaded, expected);
}

TEST_F(LibraryTest, DatePolicyNestsByCreationDate) {
    const auto photo = writeFile(inbox / "dated.jpg", "exif someday");

    fs::path rel;
    try {
        rel = destinationFor(photo, SortPolicy::Date);
    } catch (const MetadataError&) {
        GTEST_SKIP() << "filesystem under " << root << " does not record creation times";
    }

    auto lib = Library::load(output);
    lib.place(lib.checkNew({photo}), SortPolicy::Date);

    ASSERT_EQ(lib.size(), 1u);
    EXPECT_EQ(lib.entries()[0].rel_path, rel);
    EXPECT_EQ(std::distance(rel.begin(), rel.end()), 4);
    EXPECT_TRUE(fs::is_directory((output / rel).parent_path()));
    EXPECT_EQ(readFile(output / rel), "exif someday");
    EXPECT_FALSE(fs::exists(photo));
}

TEST_F(LibraryTest, FileAlreadyAtItsDestinationIsRecorded) {
    const auto inPlace = writeFile(output / "x.jpg", "already sorted");
    const auto incoming = writeFile(inbox / "y.jpg", "new one");

    auto lib = Library::load(output);
    lib.place(lib.checkNew({inPlace, incoming}), SortPolicy::MoveToRoot);

    ASSERT_EQ(lib.size(), 2u);
    EXPECT_EQ(lib.entries()[0].relPathString(), "x.jpg");
    EXPECT_EQ(lib.entries()[1].relPathString(), "y.jpg");
    EXPECT_EQ(readFile(output / "x.jpg"), "already sorted");
    EXPECT_EQ(readFile(output / "y.jpg"), "new one");
}

TEST_F(LibraryTest, OpenDoesNotCreateMetadata) {
    const auto lib = Library::open(output);
    EXPECT_TRUE(lib.entries().empty());
    EXPECT_FALSE(fs::exists(output / "_pometa"));
    EXPECT_TRUE(fs::is_empty(output));
}

TEST_F(LibraryTest, OpenSeesPersistedEntries) {
    {
        auto lib = Library::load(output);
        lib.place(lib.checkNew({writeFile(inbox / "a.jpg", "a")}), SortPolicy::MoveToRoot);
        lib.persist();
    }
    const auto lib = Library::open(output);
    ASSERT_EQ(lib.size(), 1u);
    EXPECT_EQ(lib.entries()[0].relPathString(), "a.jpg");
}
