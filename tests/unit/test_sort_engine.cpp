#include <catch2/catch_test_macros.hpp>

#include "AppException.hpp"
#include "SortEngine.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct SortFixture : ClassifierFixture {
    SortEngine engine{classifier, trash, nullptr};
};

}

TEST_CASE("a month backup is split by its majority date and archived under its year") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    const auto backup = root / "2019-09";
    write_dated_file(backup / "a.jpg", 2019, 9, 3);
    write_dated_file(backup / "b.jpg", 2019, 9, 3);
    write_dated_file(backup / "c.jpg", 2019, 9, 3);
    write_dated_file(backup / "d.jpg", 2019, 8, 30);
    write_dated_file(backup / "e.jpg", 2019, 8, 30);

    const SortReport report = fx.engine.run(root, fx.decisions);

    CHECK(report.status == RunStatus::Completed);
    CHECK(report.archived_folders == 1);
    CHECK(report.moved == 2);
    CHECK(report.kept == 3);
    CHECK(fs::exists(root / "2019" / "08-August" / "d.jpg"));
    CHECK(fs::exists(root / "2019" / "08-August" / "e.jpg"));
    for (const char* name : {"a.jpg", "b.jpg", "c.jpg"}) {
        CHECK(fs::exists(root / "2019" / "2019-09" / name));
    }
    CHECK_FALSE(fs::exists(backup));
    CHECK(fx.decisions.folder_prompts.empty());

    SECTION("a second run changes nothing") {
        const SortReport again = fx.engine.run(root, fx.decisions);
        CHECK(again.moved == 0);
        CHECK(again.archived_folders == 0);
        CHECK(fs::exists(root / "2019" / "2019-09" / "a.jpg"));
    }
}

TEST_CASE("a day backup keeps its own day and sends stragglers away") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    const auto backup = root / "2021-09-07";
    write_dated_file(backup / "a.jpg", 2021, 9, 7);
    write_dated_file(backup / "b.jpg", 2021, 5, 1);
    write_file(backup / "shot.png");

    const SortReport report = fx.engine.run(root, fx.decisions);

    CHECK(report.archived_folders == 1);
    CHECK(fs::exists(root / "2021" / "2021-09-07" / "a.jpg"));
    CHECK(fs::exists(root / "2021" / "05-May" / "b.jpg"));
    CHECK(fs::exists(root / "Screenshots" / "shot.png"));
}

TEST_CASE("a backup whose archive folder already exists is merged into it") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    const auto archive = root / "2019" / "2019-09";
    write_dated_file(archive / "old.jpg", 2019, 9, 3);
    const auto backup = root / "2019-09";
    write_dated_file(backup / "a.jpg", 2019, 9, 3);
    write_dated_file(backup / "b.jpg", 2019, 9, 3);
    write_dated_file(backup / "c.jpg", 2019, 9, 3);
    fx.decisions.fallback_folder = FolderDecision::SortIntoYears;

    const SortReport report = fx.engine.run(root, fx.decisions);

    CHECK(fx.decisions.folder_prompts.empty());
    CHECK(report.archived_folders == 1);
    for (const char* name : {"old.jpg", "a.jpg", "b.jpg", "c.jpg"}) {
        CHECK(fs::exists(archive / name));
    }
    CHECK_FALSE(fs::exists(backup));
    CHECK_FALSE(fs::exists(root / "2019" / "2019-09 (1)"));

    const SortReport again = fx.engine.run(root, fx.decisions);
    CHECK(again.moved == 0);
    CHECK(fx.decisions.folder_prompts.empty());
    CHECK(fs::exists(archive / "a.jpg"));
}

TEST_CASE("nested backups are consolidated deepest first") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    const auto outer = root / "2019-09";
    const auto inner = outer / "2019-09-07";
    write_dated_file(inner / "x.jpg", 2019, 9, 7);
    write_dated_file(inner / "y.jpg", 2019, 6, 1);
    write_dated_file(outer / "a.jpg", 2019, 9, 3);
    write_dated_file(outer / "b.jpg", 2019, 9, 3);
    write_dated_file(outer / "c.jpg", 2019, 9, 3);

    const SortReport report = fx.engine.run(root, fx.decisions);

    CHECK(report.archived_folders == 2);
    CHECK(fs::exists(root / "2019" / "2019-09-07" / "x.jpg"));
    CHECK(fs::exists(root / "2019" / "06-June" / "y.jpg"));
    CHECK(fs::exists(root / "2019" / "2019-09" / "a.jpg"));
    CHECK_FALSE(fs::exists(root / "2019" / "2019-09" / "2019-09-07"));
    CHECK_FALSE(fs::exists(outer));
}

TEST_CASE("screen recordings inside a backup go to the recordings bucket") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    const auto backup = root / "2021-09-07";
    write_dated_file(backup / "a.jpg", 2021, 9, 7);
    write_dated_file(backup / "ScreenRecording_01.mp4", 2021, 9, 7);
    write_dated_file(backup / "capture.mov", 2021, 9, 7);
    fx.metadata.video_tags["capture.mov"] = "com.apple.AVFoundation";

    const SortReport report = fx.engine.run(root, fx.decisions);

    CHECK(report.moved == 2);
    CHECK(report.kept == 1);
    CHECK(fs::exists(root / "ScreenRecordings" / "ScreenRecording_01.mp4"));
    CHECK(fs::exists(root / "ScreenRecordings" / "capture.mov"));
    CHECK(fs::exists(root / "2021" / "2021-09-07" / "a.jpg"));
    CHECK_FALSE(fs::exists(root / "2021" / "2021-09-07" / "capture.mov"));
}

TEST_CASE("an undated backup is dispersed and removed once empty") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    const auto backup = root / "09-2019";
    write_dated_file(backup / "a.jpg", 2019, 9, 3);
    write_dated_file(backup / "b.jpg", 2019, 9, 5);

    const SortReport report = fx.engine.run(root, fx.decisions);

    CHECK(report.archived_folders == 0);
    CHECK(report.moved == 2);
    CHECK(fs::exists(root / "2019" / "09-September" / "a.jpg"));
    CHECK(fs::exists(root / "2019" / "09-September" / "b.jpg"));
    CHECK_FALSE(fs::exists(backup));
}

TEST_CASE("an undated backup with leftovers stays in place") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    const auto backup = root / "09-2019";
    write_dated_file(backup / "a.jpg", 2019, 9, 3);
    write_dated_file(backup / "b.jpg", 2019, 9, 5);
    write_file(backup / "notes.txt");

    fx.engine.run(root, fx.decisions);

    CHECK(fs::exists(backup / "notes.txt"));
    CHECK(fs::exists(root / "2019" / "09-September" / "a.jpg"));
}

TEST_CASE("loose files at the root are placed by the final sweep") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    write_dated_file(root / "IMG_0001.jpg", 2020, 1, 15);
    write_file(root / "IMG_0002.png");
    write_dated_file(root / "2020" / "01-January" / "IMG_0003.jpg", 2020, 1, 16);
    write_file(root / "Screenshots" / "old.png");

    const SortReport report = fx.engine.run(root, fx.decisions);

    CHECK(report.moved == 2);
    CHECK(fs::exists(root / "2020" / "01-January" / "IMG_0001.jpg"));
    CHECK(fs::exists(root / "2020" / "01-January" / "IMG_0003.jpg"));
    CHECK(fs::exists(root / "Screenshots" / "IMG_0002.png"));
    CHECK(fs::exists(root / "Screenshots" / "old.png"));

    const SortReport again = fx.engine.run(root, fx.decisions);
    CHECK(again.moved == 0);
}

TEST_CASE("folder decisions drive the walk") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    const auto trip = root / "Trip";
    write_dated_file(trip / "a.jpg", 2018, 7, 1);
    write_file(trip / "b.png");

    SECTION("sort inside keeps the structure under the folder") {
        fx.decisions.folder_answers.push_back(FolderDecision::SortInside);
        const SortReport report = fx.engine.run(root, fx.decisions);
        CHECK(report.moved == 2);
        CHECK(fs::exists(trip / "2018" / "07-July" / "a.jpg"));
        CHECK(fs::exists(trip / "Screenshots" / "b.png"));
        CHECK_FALSE(fs::exists(root / "2018"));
    }

    SECTION("sort into years empties the folder into the root") {
        fx.decisions.folder_answers.push_back(FolderDecision::SortIntoYears);
        const SortReport report = fx.engine.run(root, fx.decisions);
        CHECK(report.moved == 2);
        CHECK(fs::exists(root / "2018" / "07-July" / "a.jpg"));
        CHECK(fs::exists(root / "Screenshots" / "b.png"));
        CHECK_FALSE(fs::exists(trip));
    }

    SECTION("skip leaves the folder untouched") {
        fx.decisions.folder_answers.push_back(FolderDecision::Skip);
        const SortReport report = fx.engine.run(root, fx.decisions);
        CHECK(report.moved == 0);
        CHECK(fs::exists(trip / "a.jpg"));
        CHECK(fs::exists(trip / "b.png"));
    }

    SECTION("keep relocates the whole folder") {
        TempDir elsewhere;
        fx.decisions.folder_answers.push_back(FolderDecision::Keep);
        fx.decisions.relocation_answers.push_back(elsewhere.path());
        const SortReport report = fx.engine.run(root, fx.decisions);
        CHECK(report.moved == 1);
        CHECK(fs::exists(elsewhere.path() / "Trip" / "a.jpg"));
        CHECK_FALSE(fs::exists(trip));
    }

    SECTION("keep without a target leaves the folder in place") {
        fx.decisions.folder_answers.push_back(FolderDecision::Keep);
        const SortReport report = fx.engine.run(root, fx.decisions);
        CHECK(report.moved == 0);
        CHECK(fx.decisions.relocation_prompts.size() == 1);
        CHECK(fs::exists(trip / "a.jpg"));
    }

    SECTION("keep into the folder itself is refused") {
        fx.decisions.folder_answers.push_back(FolderDecision::Keep);
        fx.decisions.relocation_answers.push_back(trip / "sub");
        const SortReport report = fx.engine.run(root, fx.decisions);
        CHECK(report.skipped == 1);
        CHECK(fs::exists(trip / "a.jpg"));
    }

    SECTION("quit stops before the final sweep") {
        write_dated_file(root / "loose.jpg", 2017, 3, 3);
        fx.decisions.folder_answers.push_back(FolderDecision::Quit);
        const SortReport report = fx.engine.run(root, fx.decisions);
        CHECK(report.status == RunStatus::Cancelled);
        CHECK(fs::exists(root / "loose.jpg"));
        CHECK(fs::exists(trip / "a.jpg"));
    }
}

TEST_CASE("inner folders are asked about before their parents") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    write_dated_file(root / "Outer" / "a.jpg", 2018, 1, 1);
    write_dated_file(root / "Outer" / "Inner" / "b.jpg", 2018, 1, 2);

    fx.engine.run(root, fx.decisions);

    const std::vector<fs::path> expected{root / "Outer" / "Inner", root / "Outer"};
    CHECK(fx.decisions.folder_prompts == expected);
    CHECK(fs::exists(root / "Outer" / "Inner" / "b.jpg"));
}

TEST_CASE("folders without media are never asked about") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    fs::create_directories(root / "empty" / "nested");
    write_file(root / "docs" / "notes.txt");

    const SortReport report = fx.engine.run(root, fx.decisions);

    CHECK(fx.decisions.folder_prompts.empty());
    CHECK_FALSE(fs::exists(root / "empty"));
    CHECK(report.pruned >= 2);
    CHECK(fs::exists(root / "docs" / "notes.txt"));
}

TEST_CASE("sidecars are trashed before sorting") {
    TempDir temp;
    SortFixture fx;
    const auto root = temp.path();
    write_file(root / "Thumbs.db");
    write_file(root / "Trip" / "IMG_0001.AAE");

    const SortReport report = fx.engine.run(root, fx.decisions);

    CHECK(report.trashed == 2);
    CHECK(fx.trash.trashed.size() == 2);
    CHECK_FALSE(fs::exists(root / "Trip"));
}

TEST_CASE("is_already_placed recognizes finished locations") {
    SortFixture fx;
    const fs::path root = "/photos";
    CHECK(fx.engine.is_already_placed(root, root / "2019" / "08-August" / "a.jpg"));
    CHECK(fx.engine.is_already_placed(root, root / "Screenshots" / "a.png"));
    CHECK_FALSE(fx.engine.is_already_placed(root, root / "a.jpg"));
    CHECK_FALSE(fx.engine.is_already_placed(root, root / "Trip" / "a.jpg"));
    CHECK_FALSE(fx.engine.is_already_placed(root, root / "2019" / "a.jpg"));
}

TEST_CASE("sorting a missing or non-directory root fails") {
    TempDir temp;
    SortFixture fx;

    try {
        fx.engine.run(temp.path() / "missing", fx.decisions);
        FAIL("expected an exception");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::ROOT_NOT_FOUND);
    }

    write_file(temp.path() / "file.jpg");
    try {
        fx.engine.run(temp.path() / "file.jpg", fx.decisions);
        FAIL("expected an exception");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::ROOT_NOT_DIRECTORY);
    }
}
