#include <catch2/catch_test_macros.hpp>

#include "ConsoleDecisionSource.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <sstream>
#include <string>

namespace {

struct Console {
    explicit Console(const std::string& input) : in(input) {}

    std::istringstream in;
    std::ostringstream out;
    ConsoleDecisionSource source{in, out, nullptr};
};

DuplicateGroup three_copies()
{
    DuplicateGroup group;
    group.size_bytes = 10;
    const auto when = local_noon(2020, 1, 1);
    group.members = {{"/photos/a.jpg", when}, {"/photos/b.jpg", when}, {"/photos/c.jpg", when}};
    return group;
}

}

TEST_CASE("folder prompt accepts letters and words") {
    CHECK(Console("k\n").source.decide_folder("/photos/Trip") == FolderDecision::Keep);
    CHECK(Console("Inside\n").source.decide_folder("/photos/Trip") == FolderDecision::SortInside);
    CHECK(Console(" y \n").source.decide_folder("/photos/Trip") == FolderDecision::SortIntoYears);
    CHECK(Console("s\n").source.decide_folder("/photos/Trip") == FolderDecision::Skip);
    CHECK(Console("q\n").source.decide_folder("/photos/Trip") == FolderDecision::Quit);
}

TEST_CASE("unknown answers repeat the prompt") {
    Console console("what\nmaybe\ni\n");
    CHECK(console.source.decide_folder("/photos/Trip") == FolderDecision::SortInside);
    CHECK(console.out.str().find("Please answer k, i, y, s or q.") != std::string::npos);
}

TEST_CASE("end of input means quit") {
    CHECK(Console("").source.decide_folder("/photos/Trip") == FolderDecision::Quit);
    CHECK(Console("").source.decide_live_photo("/photos/a-live.mov") == LivePhotoDecision::Quit);
    CHECK(Console("").source.review_image("/photos/a.jpg") == ImageReviewDecision::quit());
    CHECK(Console("").source.decide_duplicate(three_copies(), 0).action == DuplicateDecision::Action::Quit);
    CHECK_FALSE(Console("").source.pick_relocation_target("/photos/Trip").has_value());
}

TEST_CASE("duplicate prompt marks the default and parses choices") {
    Console confirm("\n");
    CHECK(confirm.source.decide_duplicate(three_copies(), 1).action == DuplicateDecision::Action::ConfirmDefault);
    CHECK(confirm.out.str().find("*1 2020-01-01  /photos/b.jpg") != std::string::npos);

    const auto keep = Console("2\n").source.decide_duplicate(three_copies(), 0);
    CHECK(keep.action == DuplicateDecision::Action::KeepIndex);
    CHECK(keep.index == 2);

    CHECK(Console("a\n").source.decide_duplicate(three_copies(), 0).action == DuplicateDecision::Action::KeepAll);
    CHECK(Console("d\n").source.decide_duplicate(three_copies(), 0).action == DuplicateDecision::Action::DeleteAll);

    Console out_of_range("7\n-1\n0\n");
    const auto retried = out_of_range.source.decide_duplicate(three_copies(), 1);
    CHECK(retried.action == DuplicateDecision::Action::KeepIndex);
    CHECK(retried.index == 0);
}

TEST_CASE("relocation target is taken verbatim apart from surrounding blanks") {
    const auto target = Console("  /backup/Kept Trips  \n").source.pick_relocation_target("/photos/Trip");
    REQUIRE(target.has_value());
    CHECK(*target == std::filesystem::path("/backup/Kept Trips"));
    CHECK_FALSE(Console("\n").source.pick_relocation_target("/photos/Trip").has_value());
}

TEST_CASE("live photo and image prompts") {
    CHECK(Console("t\n").source.decide_live_photo("/photos/a-live.mov") == LivePhotoDecision::Trash);
    CHECK(Console("keep\n").source.decide_live_photo("/photos/a-live.mov") == LivePhotoDecision::Keep);
    CHECK(Console("o\n").source.review_image("/photos/a.jpg") == ImageReviewDecision::ok());
    CHECK(Console("J\n").source.review_image("/photos/a.jpg") == ImageReviewDecision::junk());
    CHECK(Console("m\n").source.review_image("/photos/a.jpg") == ImageReviewDecision::meme());
    CHECK(Console("skip\n").source.review_image("/photos/a.jpg") == ImageReviewDecision::skip_folder());
}

TEST_CASE("image prompt asks for a new name or date") {
    CHECK(Console("r\nBeach Day\n").source.review_image("/photos/a.jpg")
          == ImageReviewDecision::rename("Beach Day"));
    CHECK(Console("r\n\no\n").source.review_image("/photos/a.jpg") == ImageReviewDecision::ok());
    CHECK(Console("r\n").source.review_image("/photos/a.jpg") == ImageReviewDecision::quit());

    CHECK(Console("c\n2015-07\n").source.review_image("/photos/a.jpg")
          == ImageReviewDecision::change_date(2015, 7));
    CHECK(Console("c\n2015\n").source.review_image("/photos/a.jpg")
          == ImageReviewDecision::change_date(2015, 1));

    Console retry("c\n2015-13\nc\n15-07\nc\n2016-02\n");
    CHECK(retry.source.review_image("/photos/a.jpg") == ImageReviewDecision::change_date(2016, 2));
    CHECK(retry.out.str().find("Please enter a date as YYYY or YYYY-MM.") != std::string::npos);
}
