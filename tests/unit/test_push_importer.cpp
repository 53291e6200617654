#include "../../src/internal/stream/fast_export_parser.hpp"
#include "../fake_wiki.hpp"
#include "../test_utils.hpp"

#include <dokuwiki/errors.hpp>
#include <dokuwiki/history_exporter.hpp>
#include <dokuwiki/push_importer.hpp>
#include <gtest/gtest.h>
#include <sstream>

using namespace dokuwiki;
using dokuwiki::test::FakeWiki;
using dokuwiki::test::LogCapture;
using dokuwiki::test::TempDir;

namespace
{
const std::string BRANCH = "refs/heads/main";

std::string data(const std::string& bytes)
{
    return "data " + std::to_string(bytes.size()) + "\n" + bytes;
}

std::string modify(const std::string& path, const std::string& content)
{
    return "M 100644 inline " + path + "\n" + data(content);
}

std::string delete_file(const std::string& path)
{
    return "D " + path + "\n";
}

std::string commit(Mark mark, const std::string& message, const std::string& changes,
                   const std::string& ref = BRANCH)
{
    return "commit " + ref + "\nmark :" + std::to_string(mark) +
           "\nauthor Dev <dev@example.com> 1700000000 +0000\n"
           "committer Dev <dev@example.com> 1700000000 +0000\n" +
           data(message) + changes + "\n";
}

stream::ExportStream parse(const std::string& text)
{
    std::istringstream in(text + "done\n");
    return stream::parse_fast_export(in, {});
}
} // namespace

class PushImporterTest : public ::testing::Test
{
  protected:
    PushImporterTest()
        : session_(wiki_, session_settings(), nullptr), client_(session_),
          identities_(dir_.file("identity.jsonl"), dir_.file("git.marks")), mapper_("")
    {
        identities_.load();
    }

    SessionSettings session_settings()
    {
        SessionSettings s;
        s.wiki_url = "https://wiki.example.com";
        s.host = "wiki.example.com";
        s.user = "admin";
        s.password = "secret";
        s.cookie_file = dir_.file("cookies.json");
        return s;
    }

    ExportResult fetch()
    {
        ExportSettings s;
        s.head_key = BRANCH;
        s.target_ref = "refs/dokuwiki/origin/heads/main";
        HistoryExporter exporter(client_, identities_, mapper_);
        ExportResult result = exporter.export_ref(s);
        exporter.record(s, result);
        return result;
    }

    std::vector<RefStatus> push(const std::string& text, PushSettings settings = PushSettings())
    {
        PushImporter importer(client_, identities_, mapper_);
        return importer.push(parse(text), settings);
    }

    TempDir dir_;
    FakeWiki wiki_;
    SessionManager session_;
    WikiClient client_;
    IdentityMap identities_;
    PathMapper mapper_;
};

TEST_F(PushImporterTest, CommitBecomesOneRevision)
{
    wiki_.seed_page("start", 100, "A", "alice", "init");
    wiki_.seed_page("other", 110, "O1", "alice");
    wiki_.seed_page("other", 120, "O2", "bob");
    fetch();

    ASSERT_NE(identities_.latest("other.txt"), nullptr);
    const IdentityEntry other_before = *identities_.latest("other.txt");
    const IdentityEntry first_before = *identities_.find("other.txt", 110);

    auto statuses = push(commit(10, "Reword intro\n\nLonger description\n",
                                modify("start.txt", "B")));
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_TRUE(statuses[0].ok) << statuses[0].reason;
    EXPECT_EQ(statuses[0].ref, BRANCH);
    EXPECT_EQ(statuses[0].applied, 1u);

    const auto& revisions = wiki_.page_revisions("start");
    ASSERT_EQ(revisions.size(), 2u);
    EXPECT_EQ(revisions.back().content, "B");
    EXPECT_EQ(revisions.back().summary, "Reword intro");
    EXPECT_EQ(revisions.back().author, "admin");

    const IdentityEntry* entry = identities_.find("start.txt", revisions.back().revision);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->mark, 10u);
    EXPECT_EQ(entry->origin, Origin::Push);
    ASSERT_TRUE(identities_.head(BRANCH).has_value());
    EXPECT_EQ(identities_.head(BRANCH)->mark, 10u);
    EXPECT_EQ(identities_.head(BRANCH)->timestamp, revisions.back().revision);

    // The untouched page keeps its revisions and mappings
    EXPECT_EQ(wiki_.page_revisions("other").size(), 2u);
    const IdentityEntry* other_after = identities_.latest("other.txt");
    ASSERT_NE(other_after, nullptr);
    EXPECT_EQ(other_after->revision, other_before.revision);
    EXPECT_EQ(other_after->mark, other_before.mark);
    EXPECT_EQ(other_after->origin, Origin::Fetch);
    ASSERT_NE(identities_.find("other.txt", 110), nullptr);
    EXPECT_EQ(identities_.find("other.txt", 110)->mark, first_before.mark);
}

TEST_F(PushImporterTest, PushedRevisionIsNotFetchedBack)
{
    wiki_.seed_page("start", 100, "A", "alice", "init");
    fetch();
    push(commit(10, "Edit", modify("start.txt", "B")));

    wiki_.reset_counts();
    ExportResult result = fetch();
    EXPECT_EQ(result.commits, 0u);
    EXPECT_EQ(result.stream, "reset refs/dokuwiki/origin/heads/main\nfrom :10\n\n");
    EXPECT_EQ(wiki_.count("core.getPage"), 0);
}

TEST_F(PushImporterTest, WikiEditSinceFetchRejectsThePush)
{
    LogCapture capture;
    wiki_.seed_page("start", 100, "A", "alice", "init");
    fetch();
    wiki_.edit_page("start", "edited in the browser");

    wiki_.reset_counts();
    auto statuses = push(commit(10, "Edit", modify("start.txt", "B")));
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_FALSE(statuses[0].ok);
    EXPECT_EQ(statuses[0].reason, "fetch first");
    EXPECT_EQ(wiki_.mutation_count(), 0);
    EXPECT_EQ(*wiki_.current_page("start"), "edited in the browser");
    EXPECT_EQ(identities_.head(BRANCH)->mark, 1u);
    EXPECT_TRUE(capture.contains("conflict on start.txt"));
}

TEST_F(PushImporterTest, PageCreatedOnWikiSinceFetchConflicts)
{
    wiki_.seed_page("start", 100, "A");
    fetch();
    wiki_.edit_page("fresh", "someone else got here first");

    auto statuses = push(commit(10, "Add fresh", modify("fresh.txt", "mine")));
    EXPECT_FALSE(statuses[0].ok);
    EXPECT_EQ(statuses[0].reason, "fetch first");
}

TEST_F(PushImporterTest, NewPagesOnAnEmptyWiki)
{
    auto statuses = push(commit(3, "Add pages", modify("start.txt", "home") +
                                                    modify("ns/sub/page.txt", "nested")));
    ASSERT_TRUE(statuses[0].ok) << statuses[0].reason;
    EXPECT_EQ(*wiki_.current_page("start"), "home");
    EXPECT_EQ(*wiki_.current_page("ns:sub:page"), "nested");
    EXPECT_EQ(identities_.live_paths().size(), 2u);
}

TEST_F(PushImporterTest, FailureStopsTheRefAndKeepsAppliedCommits)
{
    LogCapture capture;
    wiki_.fault_hook = [](const std::string& method,
                          const json& params) -> std::optional<FakeWiki::Fault>
    {
        if (method == "core.savePage" && params.value("page", std::string()) == "b")
            return FakeWiki::Fault{200, rpc::CODE_PAGE_LOCKED_DENIED, "page is locked"};
        return std::nullopt;
    };

    auto statuses = push(commit(10, "First", modify("a.txt", "a")) +
                         commit(11, "Second", modify("b.txt", "b")) +
                         commit(12, "Third", modify("c.txt", "c")));
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_FALSE(statuses[0].ok);
    EXPECT_EQ(statuses[0].applied, 1u);
    EXPECT_EQ(statuses[0].total, 3u);
    EXPECT_EQ(statuses[0].reason.rfind("pushed 1 of 3 commits; failed at :11: ", 0), 0u)
        << statuses[0].reason;
    EXPECT_EQ(statuses[0].reason.find('\n'), std::string::npos);

    EXPECT_TRUE(wiki_.current_page("a").has_value());
    EXPECT_FALSE(wiki_.current_page("c").has_value());
    ASSERT_TRUE(identities_.head(BRANCH).has_value());
    EXPECT_EQ(identities_.head(BRANCH)->mark, 10u);
}

TEST_F(PushImporterTest, StrictModeRejectsUnrelatedWikiChanges)
{
    wiki_.seed_page("start", 100, "A");
    fetch();
    wiki_.edit_page("elsewhere", "unrelated");

    PushSettings strict;
    strict.strict = true;
    auto rejected = push(commit(10, "Edit", modify("start.txt", "B")), strict);
    EXPECT_FALSE(rejected[0].ok);
    EXPECT_EQ(rejected[0].reason, "fetch first");
    EXPECT_EQ(*wiki_.current_page("start"), "A");

    auto accepted = push(commit(10, "Edit", modify("start.txt", "B")));
    EXPECT_TRUE(accepted[0].ok) << accepted[0].reason;
    EXPECT_EQ(*wiki_.current_page("start"), "B");
}

TEST_F(PushImporterTest, DryRunWritesNothing)
{
    LogCapture capture;
    wiki_.seed_page("start", 100, "A");
    fetch();
    const size_t mapped = identities_.size();

    PushSettings dry;
    dry.dry_run = true;
    wiki_.reset_counts();
    auto statuses =
        push(commit(10, "Edit", modify("start.txt", "B") + delete_file("old.txt")), dry);
    EXPECT_TRUE(statuses[0].ok);
    EXPECT_EQ(wiki_.mutation_count(), 0);
    EXPECT_EQ(identities_.size(), mapped);
    EXPECT_EQ(identities_.head(BRANCH)->mark, 1u);
    EXPECT_TRUE(capture.contains("would update page start"));
    EXPECT_TRUE(capture.contains("would delete page old"));
}

TEST_F(PushImporterTest, OnlyTheBranchCanBePushed)
{
    auto statuses = push(commit(10, "Edit", modify("start.txt", "B"), "refs/heads/feature"));
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_FALSE(statuses[0].ok);
    EXPECT_EQ(statuses[0].reason, "only refs/heads/main can be pushed to a wiki");
    EXPECT_EQ(wiki_.mutation_count(), 0);
}

TEST_F(PushImporterTest, DeletingTheBranchIsRejected)
{
    auto statuses = push("reset refs/heads/main\nfrom " + std::string(40, '0') + "\n\n");
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_FALSE(statuses[0].ok);
    EXPECT_EQ(statuses[0].reason, "deleting the wiki branch is not supported");
}

TEST_F(PushImporterTest, RemovedFileDeletesThePage)
{
    wiki_.seed_page("start", 100, "A");
    wiki_.seed_page("old", 110, "O");
    fetch();

    auto statuses = push(commit(10, "", delete_file("old.txt")));
    ASSERT_TRUE(statuses[0].ok) << statuses[0].reason;
    EXPECT_FALSE(wiki_.current_page("old").has_value());
    EXPECT_EQ(wiki_.page_revisions("old").back().type, 'D');
    EXPECT_EQ(wiki_.page_revisions("old").back().summary, "Delete old");

    const IdentityEntry* entry = identities_.latest("old.txt");
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(entry->deleted);
    EXPECT_EQ(entry->mark, 10u);
    EXPECT_EQ(identities_.live_paths(), std::vector<std::string>{"start.txt"});
}

TEST_F(PushImporterTest, EmptiedPageIsADeletion)
{
    wiki_.seed_page("start", 100, "A");
    fetch();

    auto statuses = push(commit(10, "Blank it", modify("start.txt", "")));
    ASSERT_TRUE(statuses[0].ok) << statuses[0].reason;
    EXPECT_FALSE(wiki_.current_page("start").has_value());
    EXPECT_TRUE(identities_.latest("start.txt")->deleted);
}

TEST_F(PushImporterTest, MediaFilesAreUploadedAndDeleted)
{
    const std::string png("\x89PNG\r\n\x1a\n\0\0", 10);
    auto added = push(commit(10, "Add logo", modify("img/logo.png", png)));
    ASSERT_TRUE(added[0].ok) << added[0].reason;
    EXPECT_EQ(*wiki_.current_media("img:logo.png"), png);

    const IdentityEntry* entry = identities_.latest("img/logo.png");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->kind, EntryKind::Media);
    EXPECT_EQ(entry->wiki_id, "img:logo.png");

    auto removed = push(commit(11, "Drop logo", delete_file("img/logo.png")));
    ASSERT_TRUE(removed[0].ok) << removed[0].reason;
    EXPECT_FALSE(wiki_.current_media("img:logo.png").has_value());
    EXPECT_TRUE(identities_.latest("img/logo.png")->deleted);
}

TEST_F(PushImporterTest, UnchangedContentCreatesNoRevision)
{
    wiki_.seed_page("start", 100, "A");
    fetch();

    auto statuses = push(commit(10, "Touch", modify("start.txt", "A")));
    EXPECT_TRUE(statuses[0].ok);
    EXPECT_EQ(wiki_.page_revisions("start").size(), 1u);
    EXPECT_EQ(identities_.latest("start.txt")->mark, 1u);
}

TEST_F(PushImporterTest, MergeCommitsAreFlattened)
{
    LogCapture capture;
    std::string text = commit(10, "Base", modify("a.txt", "a"));
    text += "commit " + BRANCH + "\nmark :12\ncommitter Dev <dev@example.com> 1 +0000\n" +
            data("Merge") + "from :10\nmerge :11\n" + modify("a.txt", "merged") + "\n";

    auto statuses = push(text);
    ASSERT_TRUE(statuses[0].ok) << statuses[0].reason;
    EXPECT_EQ(statuses[0].applied, 2u);
    EXPECT_EQ(*wiki_.current_page("a"), "merged");
    EXPECT_TRUE(capture.contains("flattening merge commit :12"));
}

TEST_F(PushImporterTest, ForbiddenWriteIsReportedPerRef)
{
    wiki_.fault_hook = [](const std::string& method,
                          const json&) -> std::optional<FakeWiki::Fault>
    {
        if (method == "core.savePage")
            return FakeWiki::Fault{200, rpc::CODE_PAGE_WRITE_DENIED, "You are not allowed to edit"};
        return std::nullopt;
    };

    auto statuses = push(commit(10, "Edit", modify("start.txt", "B")));
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_FALSE(statuses[0].ok);
    EXPECT_NE(statuses[0].reason.find("failed at :10"), std::string::npos);
}

TEST_F(PushImporterTest, UnstorablePathIsReportedForTheRef)
{
    wiki_.seed_page("start", 100, "A");
    fetch();

    wiki_.reset_counts();
    std::vector<RefStatus> statuses;
    EXPECT_NO_THROW(statuses = push(commit(10, "Colon", modify("start.txt", "B") +
                                                            modify("a:b.txt", "x"))));
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_FALSE(statuses[0].ok);
    EXPECT_EQ(statuses[0].applied, 0u);
    EXPECT_NE(statuses[0].reason.find("a:b.txt"), std::string::npos) << statuses[0].reason;
    EXPECT_EQ(wiki_.mutation_count(), 0);
    EXPECT_EQ(*wiki_.current_page("start"), "A");
}
