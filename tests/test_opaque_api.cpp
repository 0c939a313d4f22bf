#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <linedocs/line_docs/line_file_docs.h>
#include <linedocs/utils/logger.h>
#include <testing_utilities.h>

#include <stdlib.h>

#include <cstring>
#include <string>

using namespace linedocs_test;

static std::string as_string(const char *data, size_t length) {
    return std::string(data, length);
}

TEST_CASE("Opaque reader creation and destruction") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string path = env.create_corpus("c.txt", make_corpus_lines(10));
    linedocs_handle_t handle = linedocs_create(path.c_str(), -1, 1);
    CHECK(handle != nullptr);

    if (handle) {
        linedocs_destroy(handle);
    }
}

TEST_CASE("Opaque reader invalid parameters") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    CHECK(linedocs_create(nullptr, -1, 1) == nullptr);

    std::string missing = env.get_dir() + "/missing.txt";
    CHECK(linedocs_create(missing.c_str(), -1, 1) == nullptr);

    linedocs_record_t record;
    CHECK(linedocs_next(nullptr, &record) == -1);
    CHECK(linedocs_reset(nullptr, 1) == -1);

    // no-ops
    linedocs_close(nullptr);
    linedocs_destroy(nullptr);
}

TEST_CASE("Opaque reader records") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    auto lines = make_corpus_lines(3);
    std::string path = env.create_corpus("c.txt", lines);
    linedocs_handle_t handle = linedocs_create(path.c_str(), -1, 0);
    REQUIRE(handle != nullptr);

    linedocs_record_t record;
    std::memset(&record, 0, sizeof(record));
    CHECK(linedocs_next(handle, nullptr) == -1);

    for (size_t i = 0; i < 4; ++i) {
        REQUIRE(linedocs_next(handle, &record) == 0);
        CHECK(record.id == i);
        std::string line =
            join_fields(as_string(record.title, record.title_length),
                        as_string(record.date, record.date_length),
                        as_string(record.body, record.body_length));
        CHECK(line == lines[i % lines.size()]);
    }

    CHECK(linedocs_reset(handle, 7) == 0);
    REQUIRE(linedocs_next(handle, &record) == 0);
    CHECK(record.id == 0);

    linedocs_close(handle);
    CHECK(linedocs_next(handle, &record) == -1);
    CHECK(linedocs_reset(handle, -1) == 0);
    CHECK(linedocs_next(handle, &record) == 0);

    linedocs_destroy(handle);
}

TEST_CASE("Opaque reader malformed line") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string path = env.write_file("bad.txt", "not a record\n");
    linedocs_handle_t handle = linedocs_create(path.c_str(), -1, 1);
    REQUIRE(handle != nullptr);

    linedocs_record_t record;
    CHECK(linedocs_next(handle, &record) == -1);
    linedocs_destroy(handle);
}

TEST_CASE("Log level control") {
    CHECK(linedocs_set_log_level("debug") == 0);
    CHECK(std::string(linedocs_get_log_level_string()) == "debug");
    CHECK(linedocs_get_log_level_int() == 1);

    CHECK(linedocs_set_log_level_int(3) == 0);
    CHECK(std::string(linedocs_get_log_level_string()) == "warn");

    CHECK(linedocs_set_log_level(nullptr) == -1);
    CHECK(linedocs_set_log_level("") == -1);
    CHECK(linedocs_set_log_level_int(42) == -1);

    CHECK(linedocs::logger::set_log_level("ERROR") == 0);
    CHECK(linedocs::logger::get_log_level_int() == 4);
    CHECK(linedocs::logger::set_log_level("info") == 0);
}

TEST_CASE("Log level from the environment") {
    CHECK(linedocs_set_log_level("info") == 0);

    ::setenv("LINEDOCS_LOG_LEVEL", "error", 1);
    linedocs::logger::init_from_environment();
    CHECK(linedocs_get_log_level_int() == 4);

    // unset leaves the current level alone
    ::unsetenv("LINEDOCS_LOG_LEVEL");
    CHECK(linedocs_set_log_level("warn") == 0);
    linedocs::logger::init_from_environment();
    CHECK(std::string(linedocs_get_log_level_string()) == "warn");

    CHECK(linedocs_set_log_level("info") == 0);
}
