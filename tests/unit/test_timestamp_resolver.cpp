#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.hpp"
#include "TimestampResolver.hpp"

#include <chrono>
#include <filesystem>

TEST_CASE("earliest timestamp follows a back-dated modification time") {
    TempDir temp;
    const auto file = temp.path() / "IMG_0001.jpg";
    write_dated_file(file, 2016, 7, 4);

    const auto timestamp = TimestampResolver::earliest_timestamp(file);
    CHECK(TimestampResolver::to_local_date(timestamp) == CalendarDate{2016, 7, 4});
}

TEST_CASE("earliest timestamp of a vanished file falls back to its folder") {
    TempDir temp;
    const auto folder = temp.path() / "album";
    std::filesystem::create_directories(folder);

    const auto before = std::chrono::system_clock::now() - std::chrono::hours(1);
    const auto timestamp = TimestampResolver::earliest_timestamp(folder / "missing.jpg");
    CHECK(timestamp >= before);
    CHECK(timestamp <= std::chrono::system_clock::now());
}

TEST_CASE("earliest timestamp of a path with no surviving ancestor is now") {
    const auto before = std::chrono::system_clock::now();
    const auto timestamp = TimestampResolver::earliest_timestamp(
        "/definitely/not/here/photo-sorter/missing.jpg");
    CHECK(timestamp >= before);
}

TEST_CASE("month folder names use two digits and English month names") {
    CHECK(TimestampResolver::month_folder_name({2021, 4, 1}) == "04-April");
    CHECK(TimestampResolver::month_folder_name({2021, 11, 30}) == "11-November");
    CHECK(TimestampResolver::dated_folder("/root", {2019, 8, 30})
          == std::filesystem::path("/root/2019/08-August"));
}
