#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <linedocs/common/file_handle.h>
#include <linedocs/common/platform_compat.h>
#include <linedocs/cursor/boundary_aligner.h>
#include <linedocs/cursor/corpus_cursor.h>
#include <linedocs/cursor/corpus_handle.h>
#include <linedocs/cursor/line_reader.h>
#include <linedocs/lifecycle/temp_file_reaper.h>
#include <linedocs/line_docs/error.h>
#include <linedocs/utils/filesystem.h>
#include <testing_utilities.h>

#include <cstdio>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace linedocs;
using namespace linedocs_test;

namespace {
std::vector<std::string> read_lines(FILE *file, std::size_t buffer_size) {
    LineReader reader(file, buffer_size);
    std::vector<std::string> lines;
    std::string line;
    while (reader.read_line(line)) {
        lines.push_back(line);
    }
    return lines;
}

CorpusLocation location_of(const std::string &path,
                           const TestEnvironment &env) {
    CorpusLocation location;
    location.path = path;
    location.temp_dir = env.get_dir();
    return location;
}
}  // namespace

TEST_CASE("Line reader - terminators") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string path =
        env.write_file("mixed.txt", "one\ntwo\r\nthree\rfour\n\nlast");
    const std::vector<std::string> expected = {"one",  "two", "three",
                                               "four", "",    "last"};

    // tiny buffers split "\r\n" across refills
    for (std::size_t buffer_size : {1, 2, 3, 5, 64}) {
        FileHandle file(std::fopen(path.c_str(), "rb"));
        REQUIRE(file != nullptr);
        CAPTURE(buffer_size);
        CHECK(read_lines(file.get(), buffer_size) == expected);
    }
}

TEST_CASE("Line reader - end of stream") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    SUBCASE("Empty file") {
        std::string path = env.write_file("empty.txt", "");
        FileHandle file(std::fopen(path.c_str(), "rb"));
        LineReader reader(file.get());
        std::string line = "stale";
        CHECK_FALSE(reader.read_line(line));
        CHECK(line.empty());
    }

    SUBCASE("Trailing terminator yields no extra line") {
        std::string path = env.write_file("two.txt", "a\nb\n");
        FileHandle file(std::fopen(path.c_str(), "rb"));
        CHECK(read_lines(file.get(), 64).size() == 2);
    }

    SUBCASE("Bytes pass through untouched") {
        std::string utf8 = "caf\xc3\xa9\t2024\t\xe2\x82\xac";
        std::string path = env.write_file("utf8.txt", utf8 + "\n");
        FileHandle file(std::fopen(path.c_str(), "rb"));
        auto lines = read_lines(file.get(), 64);
        REQUIRE(lines.size() == 1);
        CHECK(lines[0] == utf8);
    }
}

TEST_CASE("Boundary aligner") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    SUBCASE("Stops on the next line break") {
        std::string path = env.write_file("a.txt", "abcdef\nghij\n");
        FileHandle file(std::fopen(path.c_str(), "rb"));
        REQUIRE(fseeko(file.get(), 2, SEEK_SET) == 0);
        CHECK(seek_to_next_line_break_or_end(file.get()));
        CHECK(ftello(file.get()) == 6);
        CHECK(std::fgetc(file.get()) == '\n');
    }

    SUBCASE("Carriage return counts as a break") {
        std::string path = env.write_file("b.txt", "abc\r\ndef\r\n");
        FileHandle file(std::fopen(path.c_str(), "rb"));
        REQUIRE(fseeko(file.get(), 1, SEEK_SET) == 0);
        CHECK(seek_to_next_line_break_or_end(file.get()));
        CHECK(ftello(file.get()) == 3);
    }

    SUBCASE("Break beyond the first chunk") {
        std::string content(10000, 'x');
        content += "\nnext\n";
        std::string path = env.write_file("c.txt", content);
        FileHandle file(std::fopen(path.c_str(), "rb"));
        REQUIRE(fseeko(file.get(), 4, SEEK_SET) == 0);
        CHECK(seek_to_next_line_break_or_end(file.get()));
        CHECK(ftello(file.get()) == 10000);
    }

    SUBCASE("No break before the end") {
        std::string path = env.write_file("d.txt", "no line break at all");
        FileHandle file(std::fopen(path.c_str(), "rb"));
        REQUIRE(fseeko(file.get(), 4, SEEK_SET) == 0);
        CHECK_FALSE(seek_to_next_line_break_or_end(file.get()));
        CHECK(std::fgetc(file.get()) == EOF);
    }
}

TEST_CASE("Temp file reaper") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string a = env.write_file("linedocs-a.tmp", "a");
    std::string b = env.write_file("linedocs-b.tmp", "b");
    {
        TempFileReaper reaper;
        reaper.schedule(a);
        reaper.schedule(b);
        reaper.schedule(env.get_dir() + "/linedocs-missing.tmp");
        reaper.schedule("");
    }
    // the destructor drains the queue
    CHECK_FALSE(fs::exists(a));
    CHECK_FALSE(fs::exists(b));

    CHECK_FALSE(delete_quietly(env.get_dir() + "/never-existed"));
    CHECK_FALSE(delete_quietly(""));
}

TEST_CASE("Corpus handle - plain corpus") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    auto lines = make_corpus_lines(500);
    std::set<std::string> known(lines.begin(), lines.end());
    std::string path = env.create_corpus("corpus.txt", lines);
    TempFileReaper reaper;

    SUBCASE("No seed starts at the first line") {
        auto handle = CorpusHandle::open(location_of(path, env), nullptr,
                                         &reaper);
        std::string line;
        REQUIRE(handle->read_line(line));
        CHECK(line == lines[0]);
        CHECK(handle->start_offset() == 0);
        CHECK(handle->temp_path().empty());
        CHECK(handle->kind() == SourceKind::EXTERNAL);
    }

    SUBCASE("Seeded open lands on a whole line") {
        for (std::uint64_t seed = 0; seed < 50; ++seed) {
            std::mt19937_64 random(seed);
            auto handle = CorpusHandle::open(location_of(path, env), &random,
                                             &reaper);
            std::string line;
            REQUIRE(handle->read_line(line));
            CAPTURE(seed);
            CHECK(known.count(line) == 1);
            CHECK(handle->start_offset() < fs::file_size(path) / 3);
        }
    }
}

TEST_CASE("Corpus handle - gzip corpus is materialized") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    auto lines = make_corpus_lines(300);
    std::set<std::string> known(lines.begin(), lines.end());
    std::string path = env.create_gzip_corpus("corpus.txt.gz", lines);
    REQUIRE(!path.empty());

    TempFileReaper reaper;
    std::string temp_path;
    {
        std::mt19937_64 random(3);
        auto handle =
            CorpusHandle::open(location_of(path, env), &random, &reaper);
        temp_path = handle->temp_path();
        CHECK_FALSE(temp_path.empty());
        CHECK(fs::exists(temp_path));

        std::string line;
        REQUIRE(handle->read_line(line));
        CHECK(known.count(line) == 1);
    }
    CHECK(env.wait_for_no_temp_artifacts());
}

TEST_CASE("Corpus cursor - rewind and reset") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    auto lines = make_corpus_lines(3);
    std::string path = env.create_corpus("small.txt", lines);
    TempFileReaper reaper;
    CorpusCursor cursor(location_of(path, env), std::nullopt, reaper);

    SUBCASE("End of stream rewinds to the first line") {
        CHECK(cursor.next_line() == lines[0]);
        CHECK(cursor.next_line() == lines[1]);
        CHECK(cursor.next_line() == lines[2]);
        CHECK(cursor.rewind_count() == 0);
        CHECK(cursor.next_line() == lines[0]);
        CHECK(cursor.rewind_count() == 1);
    }

    SUBCASE("Ids survive a rewind and restart on reset") {
        for (int i = 0; i < 5; ++i) {
            cursor.next_line();
            CHECK(cursor.take_id() == static_cast<std::uint64_t>(i));
        }
        cursor.reset(std::nullopt);
        CHECK(cursor.take_id() == 0);
        CHECK(cursor.next_line() == lines[0]);
    }

    SUBCASE("Closed cursor") {
        cursor.close();
        cursor.close();
        CHECK_FALSE(cursor.is_open());
        try {
            cursor.next_line();
            FAIL("expected a state error");
        } catch (const LineDocsError &e) {
            CHECK(e.get_type() == LineDocsError::STATE_ERROR);
        }
        cursor.reset(std::nullopt);
        CHECK(cursor.is_open());
        CHECK(cursor.next_line() == lines[0]);
    }
}

TEST_CASE("Corpus cursor - corpus without lines") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string path = env.write_file("empty.txt", "");
    TempFileReaper reaper;
    CorpusCursor cursor(location_of(path, env), std::nullopt, reaper);
    try {
        cursor.next_line();
        FAIL("expected a format error");
    } catch (const LineDocsError &e) {
        CHECK(e.get_type() == LineDocsError::FORMAT_ERROR);
    }
}

TEST_CASE("Corpus cursor - missing corpus") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    TempFileReaper reaper;
    CHECK_THROWS_AS(CorpusCursor(location_of(env.get_dir() + "/missing.txt",
                                             env),
                                 std::nullopt, reaper),
                    LineDocsError);
}
