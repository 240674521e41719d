#include <gtest/gtest.h>
#include "../src/ProfileStore.hh"

#include <cstdio>
#include <fstream>

namespace
{
    string freshFile(const string &name)
    {
        remove(name.c_str());
        return name;
    }
}

TEST(ProfileStoreTest, CreateGetAndList)
{
    ProfileStore store(freshFile("profiles_test_basic.json"));

    EXPECT_TRUE(store.createProfile("work", {{"api_id", 111}, {"phone", "+1555"}}));
    EXPECT_TRUE(store.createProfile("home", json::object()));
    EXPECT_FALSE(store.createProfile("work", json::object()));
    EXPECT_FALSE(store.createProfile("", json::object()));

    auto work = store.getProfile("work");
    ASSERT_TRUE(work.has_value());
    EXPECT_EQ((*work)["api_id"], 111);
    EXPECT_TRUE(work->contains("created_at"));
    EXPECT_EQ((*work)["created_at"], (*work)["updated_at"]);

    EXPECT_FALSE(store.getProfile("nobody").has_value());
    EXPECT_EQ(store.listProfiles().size(), 2u);
}

TEST(ProfileStoreTest, UpdateMergesAndDeleteRemoves)
{
    ProfileStore store(freshFile("profiles_test_update.json"));
    store.createProfile("work", {{"api_id", 111}, {"phone", "+1555"}});

    EXPECT_TRUE(store.updateProfile("work", {{"phone", "+1666"}}));
    auto work = store.getProfile("work");
    EXPECT_EQ((*work)["phone"], "+1666");
    EXPECT_EQ((*work)["api_id"], 111);

    EXPECT_FALSE(store.updateProfile("nobody", {{"phone", "+1"}}));

    EXPECT_TRUE(store.deleteProfile("work"));
    EXPECT_FALSE(store.deleteProfile("work"));
    EXPECT_TRUE(store.listProfiles().empty());
}

TEST(ProfileStoreTest, ChangesSurviveReload)
{
    const string file = freshFile("profiles_test_reload.json");

    {
        ProfileStore store(file);
        store.createProfile("work", {{"api_id", 222}});
    }

    ProfileStore reopened(file);
    auto work = reopened.getProfile("work");
    ASSERT_TRUE(work.has_value());
    EXPECT_EQ((*work)["api_id"], 222);
}

TEST(ProfileStoreTest, CorruptFileIsReportedNotThrown)
{
    const string file = freshFile("profiles_test_corrupt.json");
    {
        ofstream out(file);
        out << "[1, 2";
    }

    ProfileStore store(file);
    EXPECT_FALSE(store.load());
    EXPECT_TRUE(store.listProfiles().empty());
}
