#include "../../src/internal/stream/fast_export_parser.hpp"
#include "../../src/internal/stream/fast_import_writer.hpp"
#include "../test_utils.hpp"

#include <dokuwiki/errors.hpp>
#include <gtest/gtest.h>
#include <sstream>

using namespace dokuwiki;
using namespace dokuwiki::stream;

namespace
{
ExportStream parse(const std::string& text, const BlobResolver& resolve = {})
{
    std::istringstream in(text);
    return parse_fast_export(in, resolve);
}

std::string data(const std::string& bytes)
{
    return "data " + std::to_string(bytes.size()) + "\n" + bytes;
}
} // namespace

TEST(FastExportParserTest, CommitsWithBlobsAndInlineData)
{
    const std::string text = "feature done\n"
                             "blob\nmark :1\n" + data("first page\n") + "\n"
                             "reset refs/heads/main\n"
                             "commit refs/heads/main\n"
                             "mark :2\n"
                             "author A U Thor <a@example.com> 1700000000 +0100\n"
                             "committer A U Thor <a@example.com> 1700000000 +0100\n" +
                             data("Add start page\n\nLonger text\n") +
                             "M 100644 :1 start.txt\n"
                             "M 100644 inline \"dir/with \\\"quote\\\".txt\"\n" + data("inline body") +
                             "\n"
                             "\n"
                             "commit refs/heads/main\n"
                             "mark :3\n"
                             "committer A U Thor <a@example.com> 1700000100 +0100\n" +
                             data("Remove it") +
                             "from :2\n"
                             "D start.txt\n"
                             "\n"
                             "done\n";

    ExportStream stream = parse(text);
    ASSERT_EQ(stream.commits.size(), 2u);
    ASSERT_EQ(stream.refs.size(), 1u);
    EXPECT_EQ(stream.refs[0], "refs/heads/main");
    EXPECT_EQ(stream.resets.at("refs/heads/main"), "");

    const ExportCommit& first = stream.commits[0];
    EXPECT_EQ(first.mark, 2u);
    EXPECT_EQ(first.message, "Add start page\n\nLonger text\n");
    EXPECT_EQ(first.author, "A U Thor <a@example.com> 1700000000 +0100");
    ASSERT_EQ(first.changes.size(), 2u);
    EXPECT_EQ(first.changes[0].path, "start.txt");
    EXPECT_EQ(first.changes[0].content, "first page\n");
    EXPECT_EQ(first.changes[1].path, "dir/with \"quote\".txt");
    EXPECT_EQ(first.changes[1].content, "inline body");
    EXPECT_FALSE(first.from.has_value());

    const ExportCommit& second = stream.commits[1];
    EXPECT_EQ(second.from, ":2");
    ASSERT_EQ(second.changes.size(), 1u);
    EXPECT_EQ(second.changes[0].op, FileChange::Op::Delete);
    EXPECT_EQ(second.changes[0].path, "start.txt");
}

TEST(FastExportParserTest, DataIsReadByteExactly)
{
    const std::string binary("\0\nD fake\n\xff", 10);
    const std::string text = "blob\nmark :1\n" + data(binary) +
                             "commit refs/heads/main\nmark :2\n"
                             "committer c <c> 1 +0000\n" +
                             data("msg") + "M 644 :1 logo.png\n\ndone\n";

    ExportStream stream = parse(text);
    ASSERT_EQ(stream.commits.size(), 1u);
    ASSERT_EQ(stream.commits[0].changes.size(), 1u);
    EXPECT_EQ(stream.commits[0].changes[0].content, binary);
}

TEST(FastExportParserTest, UnknownMarksGoToResolver)
{
    std::vector<std::string> asked;
    BlobResolver resolve = [&](const std::string& ref)
    {
        asked.push_back(ref);
        return "resolved " + ref;
    };
    const std::string text = "commit refs/heads/main\nmark :9\ncommitter c <c> 1 +0000\n" +
                             data("m") + "from :4\n" + "M 100644 :7 a.txt\n" +
                             "M 100644 0123456789abcdef0123456789abcdef01234567 b.txt\n\ndone\n";

    ExportStream stream = parse(text, resolve);
    ASSERT_EQ(asked.size(), 2u);
    EXPECT_EQ(asked[0], ":7");
    EXPECT_EQ(stream.commits[0].changes[1].content,
              "resolved 0123456789abcdef0123456789abcdef01234567");

    EXPECT_THROW(parse(text), StreamError);
}

TEST(FastExportParserTest, MergeParentsAreKept)
{
    const std::string text = "commit refs/heads/main\nmark :5\ncommitter c <c> 1 +0000\n" +
                             data("Merge") + "from :3\nmerge :4\n\ndone\n";
    ExportStream stream = parse(text);
    ASSERT_EQ(stream.commits[0].merges.size(), 1u);
    EXPECT_EQ(stream.commits[0].merges[0], ":4");
}

TEST(FastExportParserTest, TagsAreSkippedWithWarning)
{
    dokuwiki::test::LogCapture capture;
    const std::string text = "tag v1.0\nfrom :1\ntagger t <t> 1 +0000\n" + data("release") +
                             "\nreset refs/heads/main\nfrom :1\n\ndone\n";
    ExportStream stream = parse(text);
    EXPECT_TRUE(stream.commits.empty());
    EXPECT_EQ(stream.resets.at("refs/heads/main"), ":1");
    EXPECT_TRUE(capture.contains("ignoring tag v1.0"));
}

TEST(FastExportParserTest, DeletedBranchShowsAsNullReset)
{
    ExportStream stream =
        parse("reset refs/heads/main\nfrom 0000000000000000000000000000000000000000\n\ndone\n");
    EXPECT_TRUE(stream.commits.empty());
    EXPECT_EQ(stream.resets.at("refs/heads/main"), std::string(40, '0'));
}

TEST(FastExportParserTest, UnsupportedInputIsAStreamError)
{
    const std::string header = "commit refs/heads/main\nmark :1\ncommitter c <c> 1 +0000\n" +
                               data("m");
    EXPECT_THROW(parse(header + "R a.txt b.txt\n\ndone\n"), StreamError);
    EXPECT_THROW(parse(header + "C a.txt b.txt\n\ndone\n"), StreamError);
    EXPECT_THROW(parse(header + "deleteall\n\ndone\n"), StreamError);
    EXPECT_THROW(parse(header + "M 160000 abc sub\n\ndone\n"), StreamError);
    EXPECT_THROW(parse(header + "M 120000 inline link\n" + data("target") + "\ndone\n"),
                 StreamError);
    EXPECT_THROW(parse("commit refs/heads/main\nmark :1\n" + std::string("data 50\nshort")),
                 StreamError);
    EXPECT_THROW(parse("bogus\n"), StreamError);
}

TEST(QuotedPathTest, QuoteAndUnquote)
{
    EXPECT_EQ(quote_path("plain/path.txt"), "plain/path.txt");
    EXPECT_EQ(quote_path("with space.txt"), "with space.txt");
    EXPECT_EQ(quote_path("new\nline"), "\"new\\nline\"");
    EXPECT_EQ(quote_path("back\\slash"), "\"back\\\\slash\"");
    EXPECT_EQ(quote_path("bell\a"), "\"bell\\007\"");

    EXPECT_EQ(unquote_path("\"new\\nline\""), "new\nline");
    EXPECT_EQ(unquote_path("\"caf\\303\\251.txt\""), "caf\xc3\xa9.txt");
    EXPECT_EQ(unquote_path("unquoted"), "unquoted");
}

TEST(FastImportWriterTest, WritesCommitsInFastImportSyntax)
{
    FastImportWriter writer;
    writer.feature("done");
    writer.reset("refs/dokuwiki/origin/heads/main");
    writer.commit("refs/dokuwiki/origin/heads/main", 1, Signature{"bob", "bob@wiki", 1700000000},
                  "init", std::nullopt);
    writer.modify("start.txt", "hello");
    writer.remove("old.txt");
    writer.end_commit();
    writer.progress("1 done");
    writer.done();

    EXPECT_EQ(writer.str(), "feature done\n"
                            "reset refs/dokuwiki/origin/heads/main\n"
                            "\n"
                            "commit refs/dokuwiki/origin/heads/main\n"
                            "mark :1\n"
                            "author bob <bob@wiki> 1700000000 +0000\n"
                            "committer bob <bob@wiki> 1700000000 +0000\n"
                            "data 4\ninit\n"
                            "M 100644 inline start.txt\n"
                            "data 5\nhello\n"
                            "D old.txt\n"
                            "\n"
                            "progress 1 done\n"
                            "done\n");

    writer.clear();
    EXPECT_TRUE(writer.empty());
    writer.reset("r", 7);
    EXPECT_EQ(writer.str(), "reset r\nfrom :7\n\n");
}
