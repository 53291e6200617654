#include <dokuwiki/errors.hpp>
#include <dokuwiki/path_mapper.hpp>
#include <gtest/gtest.h>

using namespace dokuwiki;

TEST(PathMapperTest, PagePathsUseDirectoriesAndExtension)
{
    PathMapper mapper("");
    EXPECT_EQ(mapper.page_path("start"), "start.txt");
    EXPECT_EQ(mapper.page_path("wiki:syntax"), "wiki/syntax.txt");
    EXPECT_EQ(mapper.media_path("wiki:logo.png"), "wiki/logo.png");
}

TEST(PathMapperTest, NamespaceIsStrippedFromPaths)
{
    PathMapper mapper("docs:api");
    EXPECT_EQ(mapper.page_path("docs:api:intro"), "intro.txt");
    EXPECT_EQ(mapper.media_path("docs:api:img:chart.svg"), "img/chart.svg");
    EXPECT_FALSE(mapper.page_path("docs:other").has_value());
    EXPECT_FALSE(mapper.page_path("docs:api").has_value());
    EXPECT_FALSE(mapper.in_scope("docs:apiary:page"));
    EXPECT_TRUE(mapper.in_scope("docs:api:page"));
}

TEST(PathMapperTest, ClassifiesByExactExtension)
{
    PathMapper mapper("");
    EXPECT_EQ(mapper.classify("start.txt"), EntryKind::Page);
    EXPECT_EQ(mapper.classify("a/b/c.txt"), EntryKind::Page);
    EXPECT_EQ(mapper.classify("notes.TXT"), EntryKind::Media);
    EXPECT_EQ(mapper.classify("archive.txt.gz"), EntryKind::Media);
    EXPECT_EQ(mapper.classify("README"), EntryKind::Media);
    EXPECT_EQ(mapper.classify("dir.txt/file"), EntryKind::Media);
    EXPECT_EQ(mapper.classify(".txt"), EntryKind::Media);
}

TEST(PathMapperTest, ChangingTheExtensionReclassifies)
{
    PathMapper txt("", "txt");
    PathMapper wiki("", ".wiki");

    EXPECT_EQ(wiki.extension(), "wiki");
    EXPECT_EQ(txt.classify("page.wiki"), EntryKind::Media);
    EXPECT_EQ(wiki.classify("page.wiki"), EntryKind::Page);
    EXPECT_EQ(wiki.classify("page.txt"), EntryKind::Media);
    EXPECT_EQ(wiki.page_path("ns:page"), "ns/page.wiki");
}

TEST(PathMapperTest, ObjectForInvertsPaths)
{
    PathMapper mapper("team");

    WikiObject page = mapper.object_for("meetings/2024.txt");
    EXPECT_EQ(page.kind, EntryKind::Page);
    EXPECT_EQ(page.id, "team:meetings:2024");
    EXPECT_EQ(mapper.page_path(page.id), "meetings/2024.txt");

    WikiObject media = mapper.object_for("img/photo.jpg");
    EXPECT_EQ(media.kind, EntryKind::Media);
    EXPECT_EQ(media.id, "team:img:photo.jpg");
    EXPECT_EQ(mapper.media_path(media.id), "img/photo.jpg");
}

TEST(PathMapperTest, RejectsPathsWithoutWikiIdentity)
{
    PathMapper mapper("");
    EXPECT_THROW(mapper.object_for(""), StreamError);
    EXPECT_THROW(mapper.object_for("/abs.txt"), StreamError);
    EXPECT_THROW(mapper.object_for("dir/"), StreamError);
    EXPECT_THROW(mapper.object_for("a//b.txt"), StreamError);
    EXPECT_THROW(mapper.object_for("a:b.txt"), StreamError);
}

TEST(PathMapperTest, EmptyExtensionIsAConfigurationError)
{
    EXPECT_THROW(PathMapper("", ""), ConfigurationError);
    EXPECT_THROW(PathMapper("", "."), ConfigurationError);
}

TEST(PathRegistryTest, SecondIdentityOnOnePathIsAmbiguous)
{
    PathRegistry registry;
    registry.claim("logo.png", "logo.png");
    registry.claim("logo.png", "logo.png");
    EXPECT_EQ(registry.owner("logo.png"), "logo.png");
    EXPECT_FALSE(registry.owner("other").has_value());

    try
    {
        registry.claim("logo.png", "page logo");
        FAIL() << "expected AmbiguousMappingError";
    }
    catch (const AmbiguousMappingError& e)
    {
        EXPECT_EQ(e.path(), "logo.png");
        EXPECT_EQ(e.first_id(), "logo.png");
        EXPECT_EQ(e.second_id(), "page logo");
        EXPECT_EQ(e.kind(), ErrorKind::AmbiguousMapping);
    }
}
