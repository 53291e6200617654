#include "../fake_wiki.hpp"
#include "../test_utils.hpp"

#include <dokuwiki/client.hpp>
#include <dokuwiki/errors.hpp>
#include <gtest/gtest.h>

using namespace dokuwiki;
using dokuwiki::test::FakeWiki;
using dokuwiki::test::LogCapture;
using dokuwiki::test::TempDir;

class WikiClientTest : public ::testing::Test
{
  protected:
    WikiClientTest() : session_(wiki_, settings(), nullptr), client_(session_) {}

    SessionSettings settings()
    {
        SessionSettings s;
        s.wiki_url = "https://wiki.example.com";
        s.host = "wiki.example.com";
        s.user = "admin";
        s.password = "secret";
        s.cookie_file = dir_.file("cookies.json");
        return s;
    }

    TempDir dir_;
    FakeWiki wiki_;
    SessionManager session_;
    WikiClient client_;
};

TEST_F(WikiClientTest, ListsPagesAndMediaInNamespace)
{
    wiki_.seed_page("start", 100, "home");
    wiki_.seed_page("ns:a", 101, "a");
    wiki_.seed_media("ns:logo.png", 102, "PNG");
    wiki_.seed_media("other.png", 103, "PNG");

    auto all = client_.list_pages("");
    EXPECT_EQ(all.size(), 2u);

    auto pages = client_.list_pages("ns");
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].id, "ns:a");
    EXPECT_EQ(pages[0].revision, 101);

    auto media = client_.list_media("ns");
    ASSERT_EQ(media.size(), 1u);
    EXPECT_EQ(media[0].id, "ns:logo.png");
    EXPECT_EQ(media[0].size, 3);
}

TEST_F(WikiClientTest, InfoOfMissingObjectIsAbsent)
{
    wiki_.seed_page("start", 100, "home", "bob");
    auto info = client_.page_info("start");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->revision, 100);
    EXPECT_EQ(info->author, "bob");

    EXPECT_FALSE(client_.page_info("nope").has_value());
    EXPECT_FALSE(client_.media_info("nope.png").has_value());
}

TEST_F(WikiClientTest, HistoryIsPagedAndSortedOldestFirst)
{
    for (int i = 0; i < 7; ++i)
        wiki_.seed_page("busy", 1000 + i, "v" + std::to_string(i), "bob", "edit " + std::to_string(i));
    wiki_.history_page_size = 3;

    auto history = client_.page_history("busy");
    ASSERT_EQ(history.size(), 7u);
    for (size_t i = 0; i < history.size(); ++i)
        EXPECT_EQ(history[i].revision, 1000 + static_cast<std::int64_t>(i));
    EXPECT_EQ(history[0].type, ChangeType::Create);
    EXPECT_EQ(history[3].summary, "edit 3");
    EXPECT_EQ(history[3].author, "bob");
    EXPECT_EQ(wiki_.count("core.getPageHistory"), 4);
}

TEST_F(WikiClientTest, CurrentRevisionIsAddedWhenServerOmitsIt)
{
    wiki_.history_includes_current = false;
    wiki_.seed_page("p", 10, "one");
    wiki_.seed_page("p", 20, "two", "carol");

    auto history = client_.page_history("p");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[1].revision, 20);
    EXPECT_EQ(history[1].author, "carol");
    EXPECT_EQ(history[1].type, ChangeType::Edit);

    wiki_.seed_page("solo", 30, "only");
    auto solo = client_.page_history("solo");
    ASSERT_EQ(solo.size(), 1u);
    EXPECT_EQ(solo[0].type, ChangeType::Create);
}

TEST_F(WikiClientTest, DeletedPageHistoryEndsWithDeleteMarker)
{
    wiki_.seed_page("gone", 10, "text");
    wiki_.seed_page_delete("gone", 20);

    auto history = client_.page_history("gone");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_TRUE(history[1].is_delete());

    auto last = client_.last_change(EntryKind::Page, "gone");
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->revision, 20);
    EXPECT_TRUE(last->is_delete());
}

TEST_F(WikiClientTest, ContentOfRevisions)
{
    wiki_.seed_page("p", 10, "old");
    wiki_.seed_page("p", 20, "new");
    wiki_.seed_media("m.bin", 30, std::string("\0\1\2", 3));

    EXPECT_EQ(client_.page_content("p"), "new");
    EXPECT_EQ(client_.page_content("p", 10), "old");
    EXPECT_EQ(client_.media_content("m.bin"), std::string("\0\1\2", 3));

    wiki_.purge("p", 10);
    EXPECT_THROW(client_.page_content("p", 10), NotFoundError);
}

TEST_F(WikiClientTest, WritesCreateRevisions)
{
    client_.put_page("fresh", "hello", "created", false);
    ASSERT_EQ(wiki_.page_revisions("fresh").size(), 1u);
    EXPECT_EQ(wiki_.page_revisions("fresh")[0].summary, "created");
    EXPECT_EQ(wiki_.page_revisions("fresh")[0].type, 'C');

    client_.put_page("fresh", "hello again", "typo", true);
    EXPECT_EQ(wiki_.page_revisions("fresh").back().type, 'e');

    client_.delete_page("fresh", "bye");
    EXPECT_FALSE(wiki_.current_page("fresh").has_value());

    client_.put_media("pic.png", std::string("\x89PNG", 4));
    EXPECT_EQ(wiki_.current_media("pic.png"), std::string("\x89PNG", 4));
    client_.delete_media("pic.png");
    EXPECT_FALSE(wiki_.current_media("pic.png").has_value());
    EXPECT_THROW(client_.delete_media("pic.png"), NotFoundError);
}

TEST_F(WikiClientTest, AclRefusalIsForbidden)
{
    wiki_.fault_hook = [](const std::string& method, const json&) -> std::optional<FakeWiki::Fault>
    {
        if (method == "core.savePage")
            return FakeWiki::Fault{200, 112, "You are not allowed to edit this page"};
        return std::nullopt;
    };
    EXPECT_THROW(client_.put_page("locked", "x", ""), ForbiddenError);
}

TEST_F(WikiClientTest, RecentChangesSinceTimestamp)
{
    wiki_.seed_page("a", 100, "a");
    wiki_.seed_page("b", 200, "b");
    wiki_.seed_page_delete("c", 300);

    auto changes = client_.recent_page_changes(150);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].id, "b");
    EXPECT_EQ(changes[1].id, "c");
    EXPECT_TRUE(changes[1].is_delete());

    EXPECT_TRUE(client_.recent_media_changes(0).empty());
}

TEST_F(WikiClientTest, EmptyRecentChangesErrorMeansNoChanges)
{
    wiki_.empty_recent_changes_is_error = true;
    EXPECT_TRUE(client_.recent_page_changes(999999999999).empty());
}

TEST_F(WikiClientTest, TransportErrorsSurfaceUnchanged)
{
    wiki_.fault_hook = [](const std::string& method, const json&) -> std::optional<FakeWiki::Fault>
    {
        if (method == "core.listPages")
            return FakeWiki::Fault{502, 0, ""};
        return std::nullopt;
    };
    EXPECT_THROW(client_.list_pages(""), TransportError);
    EXPECT_EQ(wiki_.count("core.listPages"), 1);
}
