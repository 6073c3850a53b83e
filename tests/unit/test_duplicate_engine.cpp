#include <catch2/catch_test_macros.hpp>

#include "DuplicateEngine.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct DuplicateFixture : ClassifierFixture {
    DuplicateEngine engine{classifier, trash, nullptr};
};

DuplicateGroup make_group(std::vector<DuplicateMember> members)
{
    std::sort(members.begin(), members.end(), [](const DuplicateMember& lhs, const DuplicateMember& rhs) {
        return lhs.path < rhs.path;
    });
    DuplicateGroup group;
    group.size_bytes = 4;
    group.content_hash = "hash";
    group.members = std::move(members);
    return group;
}

const fs::path& member_path(const DuplicateGroup& group, std::size_t index)
{
    return group.members.at(index).path;
}

}

TEST_CASE("find_groups only reports byte-identical media") {
    TempDir temp;
    DuplicateFixture fx;
    const auto root = temp.path();
    write_file(root / "Trip" / "a.jpg", "same");
    write_file(root / "b.jpg", "same");
    write_file(root / "c.jpg", "diff");
    write_file(root / "d.jpg", "unique size");
    write_file(root / "notes.txt", "same");

    const auto scan = fx.engine.find_groups(root);

    REQUIRE(scan.groups.size() == 1);
    const auto& group = scan.groups.front();
    REQUIRE(group.members.size() == 2);
    CHECK(group.members[0].path == root / "Trip" / "a.jpg");
    CHECK(group.members[1].path == root / "b.jpg");
    CHECK(group.size_bytes == 4);
    CHECK(group.content_hash == *DuplicateEngine::hash_file(root / "b.jpg"));
    CHECK(scan.unreadable == 0);
}

TEST_CASE("find_groups gives the same answer for any worker count") {
    TempDir temp;
    DuplicateFixture fx;
    const auto root = temp.path();
    for (int i = 0; i < 6; ++i) {
        write_file(root / "one" / ("x" + std::to_string(i) + ".jpg"), "alpha");
        write_file(root / "two" / ("y" + std::to_string(i) + ".jpg"), "bravo-" + std::to_string(i % 2));
    }

    fx.config.hash_workers = 1;
    const auto serial = fx.engine.find_groups(root);
    fx.config.hash_workers = 4;
    const auto parallel = fx.engine.find_groups(root);

    REQUIRE(serial.groups.size() == 3);
    REQUIRE(parallel.groups.size() == serial.groups.size());
    for (std::size_t g = 0; g < serial.groups.size(); ++g) {
        REQUIRE(parallel.groups[g].members.size() == serial.groups[g].members.size());
        CHECK(parallel.groups[g].content_hash == serial.groups[g].content_hash);
        for (std::size_t m = 0; m < serial.groups[g].members.size(); ++m) {
            CHECK(parallel.groups[g].members[m].path == serial.groups[g].members[m].path);
        }
    }
}

TEST_CASE("choose_default prefers the original over numbered copies") {
    DuplicateFixture fx;
    const fs::path root = "/photos";
    const auto when = local_noon(2020, 1, 1);

    SECTION("copy marker in parentheses") {
        const auto group = make_group({{root / "Trip" / "IMG_0001 (1).jpg", when - std::chrono::hours(48)},
                                       {root / "Trip" / "IMG_0001.jpg", when}});
        CHECK(member_path(group, fx.engine.choose_default(group, root)) == root / "Trip" / "IMG_0001.jpg");
    }

    SECTION("copy marker without a trailing number in the original") {
        const auto group = make_group({{root / "A (2).jpg", when}, {root / "A.jpg", when}});
        CHECK(member_path(group, fx.engine.choose_default(group, root)) == root / "A.jpg");
    }

    SECTION("live companion") {
        const auto group = make_group({{root / "IMG_0002-Live.mov", when}, {root / "IMG_0002.mov", when}});
        CHECK(member_path(group, fx.engine.choose_default(group, root)) == root / "IMG_0002.mov");
    }

    SECTION("only auxiliary members fall through to the rest of the cascade") {
        const auto group = make_group({{root / "B (1).jpg", when}, {root / "B (2).jpg", when - std::chrono::hours(1)}});
        CHECK(member_path(group, fx.engine.choose_default(group, root)) == root / "B (2).jpg");
    }
}

TEST_CASE("choose_default prefers the smallest trailing number") {
    DuplicateFixture fx;
    const fs::path root = "/photos";
    const auto when = local_noon(2020, 1, 1);
    const auto group = make_group({{root / "IMG_0012.jpg", when - std::chrono::hours(10)},
                                   {root / "IMG_0005.jpg", when},
                                   {root / "beach.jpg", when - std::chrono::hours(20)}});
    CHECK(member_path(group, fx.engine.choose_default(group, root)) == root / "IMG_0005.jpg");
}

TEST_CASE("choose_default prefers dated then generated locations") {
    DuplicateFixture fx;
    const fs::path root = "/photos";
    const auto when = local_noon(2020, 1, 1);

    SECTION("dated beats an earlier copy elsewhere") {
        const auto group = make_group({{root / "2019" / "05-May" / "sunset.jpg", when},
                                       {root / "Trip" / "beach.jpg", when - std::chrono::hours(100)}});
        CHECK(member_path(group, fx.engine.choose_default(group, root))
              == root / "2019" / "05-May" / "sunset.jpg");
    }

    SECTION("earliest of several dated copies") {
        const auto group = make_group({{root / "2019" / "05-May" / "a.jpg", when},
                                       {root / "2020" / "01-January" / "b.jpg", when - std::chrono::hours(5)},
                                       {root / "Trip" / "c.jpg", when - std::chrono::hours(100)}});
        CHECK(member_path(group, fx.engine.choose_default(group, root))
              == root / "2020" / "01-January" / "b.jpg");
    }

    SECTION("generated beats other locations") {
        const auto group = make_group({{root / "Screenshots" / "s.png", when},
                                       {root / "Trip" / "t.png", when - std::chrono::hours(100)}});
        CHECK(member_path(group, fx.engine.choose_default(group, root)) == root / "Screenshots" / "s.png");
    }
}

TEST_CASE("choose_default falls back to the earliest timestamp") {
    DuplicateFixture fx;
    const fs::path root = "/photos";
    const auto group = make_group({{root / "Other" / "b.jpg", local_noon(2018, 1, 1)},
                                   {root / "Trip" / "a.jpg", local_noon(2015, 1, 1)}});
    CHECK(member_path(group, fx.engine.choose_default(group, root)) == root / "Trip" / "a.jpg");
}

TEST_CASE("choose_default breaks full ties by location and path") {
    DuplicateFixture fx;
    const fs::path root = "/photos";
    const auto when = local_noon(2020, 1, 1);

    SECTION("smallest path among equals") {
        const auto group = make_group({{root / "Zoo" / "x.jpg", when}, {root / "Alps" / "y.jpg", when}});
        CHECK(member_path(group, fx.engine.choose_default(group, root)) == root / "Alps" / "y.jpg");
    }

    SECTION("other locations beat backup folders") {
        const auto group = make_group({{root / "2019-01" / "x.jpg", when}, {root / "Trip" / "y.jpg", when}});
        CHECK(member_path(group, fx.engine.choose_default(group, root)) == root / "Trip" / "y.jpg");
    }
}

TEST_CASE("location_kind reads the folder layout") {
    DuplicateFixture fx;
    const fs::path root = "/photos";
    using LK = DuplicateEngine::LocationKind;
    CHECK(fx.engine.location_kind(root, root / "2019" / "05-May" / "a.jpg") == LK::Dated);
    CHECK(fx.engine.location_kind(root, root / "Memes" / "a.jpg") == LK::Generated);
    CHECK(fx.engine.location_kind(root, root / "2019" / "05-May" / "deeper" / "a.jpg") == LK::Dated);
    CHECK(fx.engine.location_kind(root, root / "2019-01" / "a.jpg") == LK::Backup);
    CHECK(fx.engine.location_kind(root, root / "Trip" / "2019-01" / "a.jpg") == LK::Other);
    CHECK(fx.engine.location_kind(root, root / "Trip" / "2019" / "05-May" / "a.jpg") == LK::Other);
    CHECK(fx.engine.location_kind(root, root / "Trip" / "Memes" / "a.jpg") == LK::Other);
    CHECK(fx.engine.location_kind(root, root / "Trip" / "a.jpg") == LK::Other);
    CHECK(fx.engine.location_kind(root, root / "a.jpg") == LK::Other);
    CHECK(fx.engine.location_kind(root / "2019", root / "2019" / "05-May" / "a.jpg") == LK::Other);
}

TEST_CASE("stem helpers") {
    CHECK(DuplicateEngine::trailing_number("IMG_0042") == 42u);
    CHECK(DuplicateEngine::trailing_number("IMG_0001") == 1u);
    CHECK_FALSE(DuplicateEngine::trailing_number("beach").has_value());
    CHECK_FALSE(DuplicateEngine::trailing_number("A (2)").has_value());
    CHECK(DuplicateEngine::trailing_number("99999999999999999999999")
          == std::numeric_limits<std::uint64_t>::max() - 1);

    CHECK(DuplicateEngine::is_auxiliary_stem("IMG_0001 (1)", "-live"));
    CHECK(DuplicateEngine::is_auxiliary_stem("IMG_0001 2", "-live"));
    CHECK(DuplicateEngine::is_auxiliary_stem("IMG_0001-LIVE", "-live"));
    CHECK_FALSE(DuplicateEngine::is_auxiliary_stem("IMG_0001", "-live"));
    CHECK_FALSE(DuplicateEngine::is_auxiliary_stem("IMG_0001-live", ""));
}

TEST_CASE("hash_file reports unreadable files") {
    TempDir temp;
    CHECK_FALSE(DuplicateEngine::hash_file(temp.path() / "missing.jpg").has_value());
    write_file(temp.path() / "a.jpg", "abc");
    CHECK(*DuplicateEngine::hash_file(temp.path() / "a.jpg")
          == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("run applies each decision") {
    TempDir temp;
    DuplicateFixture fx;
    const auto root = temp.path();
    write_dated_file(root / "Copies" / "IMG_0001 (1).jpg", 2020, 1, 1, "pixels");
    write_dated_file(root / "IMG_0001.jpg", 2020, 1, 2, "pixels");

    SECTION("confirm keeps the default and prunes emptied folders") {
        const auto report = fx.engine.run(root, fx.decisions);
        CHECK(report.groups == 1);
        CHECK(report.trashed == 1);
        CHECK(report.kept == 1);
        CHECK(fs::exists(root / "IMG_0001.jpg"));
        CHECK_FALSE(fs::exists(root / "Copies"));
        REQUIRE(fx.decisions.default_indices.size() == 1);
        CHECK(fx.decisions.default_indices.front() == 1);
    }

    SECTION("keep a chosen member") {
        fx.decisions.duplicate_answers.push_back(DuplicateDecision::keep(0));
        const auto report = fx.engine.run(root, fx.decisions);
        CHECK(report.trashed == 1);
        CHECK(fs::exists(root / "Copies" / "IMG_0001 (1).jpg"));
        CHECK_FALSE(fs::exists(root / "IMG_0001.jpg"));
    }

    SECTION("an out-of-range choice keeps everything") {
        fx.decisions.duplicate_answers.push_back(DuplicateDecision::keep(7));
        const auto report = fx.engine.run(root, fx.decisions);
        CHECK(report.trashed == 0);
        CHECK(report.kept == 2);
    }

    SECTION("keep all") {
        fx.decisions.duplicate_answers.push_back(DuplicateDecision::keep_all());
        const auto report = fx.engine.run(root, fx.decisions);
        CHECK(report.trashed == 0);
        CHECK(report.kept == 2);
        CHECK(fx.trash.trashed.empty());
    }

    SECTION("delete all") {
        fx.decisions.duplicate_answers.push_back(DuplicateDecision::delete_all());
        const auto report = fx.engine.run(root, fx.decisions);
        CHECK(report.trashed == 2);
        CHECK_FALSE(fs::exists(root / "IMG_0001.jpg"));
    }

    SECTION("a refused trash is counted as failed") {
        fx.trash.refused.insert(root / "Copies" / "IMG_0001 (1).jpg");
        const auto report = fx.engine.run(root, fx.decisions);
        CHECK(report.trashed == 0);
        CHECK(report.failed == 1);
        CHECK(fs::exists(root / "Copies" / "IMG_0001 (1).jpg"));
    }

    SECTION("quit stops before touching anything") {
        write_file(root / "x.png", "another group");
        write_file(root / "y.png", "another group");
        fx.decisions.duplicate_answers.push_back(DuplicateDecision::quit());
        const auto report = fx.engine.run(root, fx.decisions);
        CHECK(report.status == RunStatus::Cancelled);
        CHECK(report.groups == 2);
        CHECK(fx.decisions.duplicate_prompts.size() == 1);
        CHECK(fx.trash.trashed.empty());
    }
}
