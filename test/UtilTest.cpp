#include <gtest/gtest.h>
#include <sstream>

#include "aux/FileWriter.hpp"
#include "aux/Sha256Hasher.hpp"
#include "core/Collaborators.hpp"
#include "util/args.hpp"
#include "util/file.hpp"
#include "util/format.hpp"
#include "TempDirectory.hpp"

static const char EMPTY_SHA256[] = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
static const char ABC_SHA256[] = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

TEST(FormatTest, Bytes)
{
    EXPECT_EQ(formatBytes(512), "512 B");
    EXPECT_EQ(formatBytes(2048), "2 KB");
    EXPECT_EQ(formatBytes(1.5 * 1024 * 1024), "1.5 MB");
    EXPECT_EQ(formatBytes(3.0 * 1024 * 1024 * 1024), "3.00 GB");
    EXPECT_EQ(formatSpeed(0), "N/A");
    EXPECT_EQ(formatSpeed(2048), "2 KB/s");
}

TEST(FormatTest, DurationAndPercent)
{
    EXPECT_EQ(formatDuration(0), "Unknown");
    EXPECT_EQ(formatDuration(42), "42s");
    EXPECT_EQ(formatDuration(125), "2m 5s");
    EXPECT_EQ(formatDuration(3725), "1h 2m 5s");
    EXPECT_EQ(formatPercent(12.345), "12.3%");
}

TEST(ArgsTest, ExtractsQuotedArguments)
{
    auto args = extractArguments("download https://example.com/a.bin \"my file.bin\"", 3);
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], "https://example.com/a.bin");
    EXPECT_EQ(args[1], "my file.bin");

    EXPECT_TRUE(extractArguments("pause", 1).empty());
    EXPECT_EQ(extractArguments("limit 3 100 extra", 2).size(), 2u);
}

TEST(ArgsTest, ParsesUnsigned)
{
    std::uint64_t value = 0;
    EXPECT_TRUE(parseUnsigned("42", value));
    EXPECT_EQ(value, 42u);
    EXPECT_FALSE(parseUnsigned("", value));
    EXPECT_FALSE(parseUnsigned("-1", value));
    EXPECT_FALSE(parseUnsigned("4x", value));
    EXPECT_FALSE(parseUnsigned("99999999999999999999999", value));
}

TEST(ArgsTest, SplitsUrlAndHash)
{
    std::string url;
    std::string hash;

    splitUrlAndHash(std::string("https://example.com/a.bin#") + ABC_SHA256, url, hash);
    EXPECT_EQ(url, "https://example.com/a.bin");
    EXPECT_EQ(hash, ABC_SHA256);

    splitUrlAndHash("https://example.com/page#section", url, hash);
    EXPECT_EQ(url, "https://example.com/page#section");
    EXPECT_TRUE(hash.empty());
}

TEST(ArgsTest, ParsesUrlList)
{
    std::istringstream list(std::string("# models to fetch\n"
                                        "https://example.com/a.bin\n"
                                        "\n"
                                        "   https://example.com/b.bin   \r\n"
                                        "  # indented comment\n"
                                        "https://example.com/c.bin#") + ABC_SHA256 + "\n"
                            "\t\n"
                            "https://example.com/d.bin");

    std::vector<std::string> urls = parseUrlList(list);
    ASSERT_EQ(urls.size(), 4u);
    EXPECT_EQ(urls[0], "https://example.com/a.bin");
    EXPECT_EQ(urls[1], "https://example.com/b.bin");
    EXPECT_EQ(urls[2], std::string("https://example.com/c.bin#") + ABC_SHA256);
    EXPECT_EQ(urls[3], "https://example.com/d.bin");

    std::string url;
    std::string hash;
    splitUrlAndHash(urls[2], url, hash);
    EXPECT_EQ(url, "https://example.com/c.bin");
    EXPECT_EQ(hash, ABC_SHA256);
}

TEST(ArgsTest, EmptyUrlListYieldsNothing)
{
    std::istringstream blank("\n  \n# only comments\n");
    EXPECT_TRUE(parseUrlList(blank).empty());

    std::istringstream none("");
    EXPECT_TRUE(parseUrlList(none).empty());
}

TEST(ArgsTest, ReadsUrlFile)
{
    TempDirectory dir;
    writeFile(dir.file("urls.txt"), "https://example.com/a.bin\n#skip\nhttps://example.com/b.bin\n");

    std::vector<std::string> urls{"https://example.com/first.bin"};
    ASSERT_TRUE(readUrlFile(dir.file("urls.txt"), urls));
    EXPECT_EQ(urls, (std::vector<std::string>{"https://example.com/first.bin",
                                              "https://example.com/a.bin",
                                              "https://example.com/b.bin"}));

    EXPECT_FALSE(readUrlFile(dir.file("missing.txt"), urls));
    EXPECT_EQ(urls.size(), 3u);
}

TEST(FileTest, PathHelpers)
{
    EXPECT_EQ(joinPath("dir", "a.bin"), "dir/a.bin");
    EXPECT_EQ(joinPath("dir/", "a.bin"), "dir/a.bin");
    EXPECT_EQ(joinPath("", "a.bin"), "a.bin");
    EXPECT_EQ(parentDirectory("dir/sub/a.bin"), "dir/sub");
    EXPECT_EQ(parentDirectory("a.bin"), ".");
    EXPECT_EQ(parentDirectory("/a.bin"), "/");
    EXPECT_EQ(sanitiseFilename("a/b:c?.bin"), "a_b_c_.bin");
}

TEST(FileTest, CreatesAndRemovesFiles)
{
    TempDirectory dir;
    std::string nested = dir.file("x/y/z");

    EXPECT_TRUE(ensureDirectory(nested));
    EXPECT_TRUE(fileExists(nested));
    EXPECT_EQ(fileSize(nested), -1);

    std::string path = joinPath(nested, "f.bin");
    writeFile(path, "hello");
    EXPECT_EQ(fileSize(path), 5);
    EXPECT_TRUE(removeFile(path));
    EXPECT_FALSE(fileExists(path));
    EXPECT_TRUE(removeFile(path));
    EXPECT_GT(availableDiskSpace(dir.path()), 0);
}

TEST(FileWriterTest, AppendsInAppendMode)
{
    TempDirectory dir;
    std::string path = dir.file("out.bin");

    {
        FileWriter writer(path, false);
        ASSERT_TRUE(writer.isOpen());
        EXPECT_TRUE(writer.write("abc", 3));
        EXPECT_EQ(writer.bytesWritten(), 3u);
    }
    {
        FileWriter writer(path, true);
        ASSERT_TRUE(writer.isOpen());
        EXPECT_TRUE(writer.write("def", 3));
        EXPECT_TRUE(writer.flush());
        writer.close();
    }
    EXPECT_EQ(readFile(path), "abcdef");

    FileWriter truncating(path, false);
    truncating.close();
    EXPECT_EQ(fileSize(path), 0);
}

TEST(FileWriterTest, ReportsOpenFailure)
{
    TempDirectory dir;
    FileWriter writer(dir.file("missing/out.bin"), false);
    EXPECT_FALSE(writer.isOpen());
    EXPECT_NE(writer.lastErrno(), 0);
    EXPECT_FALSE(writer.write("x", 1));
}

TEST(Sha256HasherTest, KnownDigests)
{
    Sha256Hasher hasher;
    EXPECT_EQ(hasher.hexDigest(), EMPTY_SHA256);

    hasher.update("a", 1);
    hasher.update("bc", 2);
    EXPECT_EQ(hasher.hexDigest(), ABC_SHA256);

    hasher.reset();
    EXPECT_EQ(hasher.hexDigest(), EMPTY_SHA256);
}

TEST(Sha256HasherTest, FileDigestAndComparison)
{
    TempDirectory dir;
    writeFile(dir.file("abc"), "abc");

    EXPECT_EQ(sha256OfFile(dir.file("abc")), ABC_SHA256);
    EXPECT_EQ(sha256OfFile(dir.file("missing")), "");
    EXPECT_TRUE(digestsEqual(ABC_SHA256, "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
    EXPECT_FALSE(digestsEqual(ABC_SHA256, EMPTY_SHA256));
    EXPECT_FALSE(digestsEqual(ABC_SHA256, "ba78"));
}

TEST(LocalArtifactCheckTest, PrefersHashThenSize)
{
    TempDirectory dir;
    std::string path = dir.file("abc");
    LocalArtifactCheck check;
    ResolvedArtifact artifact;

    EXPECT_FALSE(check.alreadyPresent(artifact, path));

    writeFile(path, "abc");
    EXPECT_FALSE(check.alreadyPresent(artifact, path));

    artifact.size = 3;
    EXPECT_TRUE(check.alreadyPresent(artifact, path));

    artifact.expectedHash = EMPTY_SHA256;
    EXPECT_FALSE(check.alreadyPresent(artifact, path));

    artifact.expectedHash = ABC_SHA256;
    EXPECT_TRUE(check.alreadyPresent(artifact, path));

    artifact.size = 4;
    EXPECT_FALSE(check.alreadyPresent(artifact, path));
}
