#include "AppException.hpp"
#include "ConsoleDecisionSource.hpp"
#include "DuplicateEngine.hpp"
#include "ImageReview.hpp"
#include "LivePhotoReview.hpp"
#include "Logger.hpp"
#include "MediaClassifier.hpp"
#include "MediaMetadataReader.hpp"
#include "QtTrashBin.hpp"
#include "Settings.hpp"
#include "SortEngine.hpp"
#include "Utils.hpp"

#include <QCoreApplication>
#include <QString>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

enum class Mode {
    Sort,
    Duplicates,
    Live,
    StrongSort
};

struct ParsedArguments {
    Mode mode{Mode::Sort};
    std::optional<std::string> root;
    bool verbose{false};
    bool show_help{false};
    std::string error;
};

void print_usage()
{
    std::fprintf(stdout,
                 "Usage: photo_sorter [--root DIR] [--duplicates | --live | --strong-sort] [--verbose]\n"
                 "\n"
                 "  --root DIR      folder to organize (default: SortFolder from config.ini)\n"
                 "  --duplicates    review byte-identical media instead of sorting\n"
                 "  --live          review live photo clips\n"
                 "  --strong-sort   sort, then review every image\n"
                 "  --verbose       debug logging\n");
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    int mode_flags = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--root") == 0) {
            if (i + 1 >= argc) {
                parsed.error = "--root needs a directory";
                return parsed;
            }
            parsed.root = argv[++i];
        } else if (std::strcmp(argv[i], "--duplicates") == 0) {
            parsed.mode = Mode::Duplicates;
            ++mode_flags;
        } else if (std::strcmp(argv[i], "--live") == 0) {
            parsed.mode = Mode::Live;
            ++mode_flags;
        } else if (std::strcmp(argv[i], "--strong-sort") == 0) {
            parsed.mode = Mode::StrongSort;
            ++mode_flags;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            parsed.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            parsed.show_help = true;
        } else {
            parsed.error = std::string("Unknown argument: ") + argv[i];
            return parsed;
        }
    }

    if (mode_flags > 1) {
        parsed.error = "--duplicates, --live and --strong-sort are mutually exclusive";
    }
    return parsed;
}

bool completed(RunStatus status)
{
    return status == RunStatus::Completed;
}

int run_application(int argc, char** argv)
{
    QCoreApplication::setApplicationName(QStringLiteral("PhotoSorter"));
    QCoreApplication app(argc, argv);

    const ParsedArguments args = parse_command_line(argc, argv);
    if (args.show_help) {
        print_usage();
        return EXIT_SUCCESS;
    }
    if (!args.error.empty()) {
        std::fprintf(stderr, "%s\n", args.error.c_str());
        print_usage();
        return EXIT_FAILURE;
    }

    Settings settings;
    settings.load();

    const auto level = args.verbose
        ? spdlog::level::debug
        : Logger::parse_level(settings.get_log_level(), spdlog::level::info);
    Logger::setup_loggers(settings.get_log_dir(), level);
    auto core_logger = Logger::get_logger("core_logger");
    auto ui_logger = Logger::get_logger("ui_logger");

    const SorterConfig config = settings.to_sorter_config();
    MediaMetadataReader metadata(core_logger);
    MediaClassifier classifier(config, metadata);
    QtTrashBin trash;
    ConsoleDecisionSource decisions(std::cin, std::cout, ui_logger);

    const std::filesystem::path root = Utils::utf8_to_path(args.root.value_or(settings.get_sort_folder()));

    switch (args.mode) {
        case Mode::Duplicates: {
            DuplicateEngine engine(classifier, trash, core_logger);
            const DuplicateReport report = engine.run(root, decisions);
            std::fprintf(stdout, "%d duplicate group(s): %d trashed, %d kept, %d failed, %d unreadable%s\n",
                         report.groups, report.trashed, report.kept, report.failed, report.unreadable,
                         completed(report.status) ? "" : " (cancelled)");
            break;
        }
        case Mode::Live: {
            LivePhotoReview review(classifier, trash, core_logger);
            const ReviewReport report = review.run(root, decisions);
            std::fprintf(stdout, "%d live clip(s) reviewed: %d trashed, %d failed%s\n",
                         report.reviewed, report.trashed, report.failed,
                         completed(report.status) ? "" : " (cancelled)");
            break;
        }
        case Mode::Sort:
        case Mode::StrongSort: {
            SortEngine engine(classifier, trash, core_logger);
            const SortReport report = engine.run(root, decisions);
            std::fprintf(stdout, "Sorted: %d moved, %d kept, %d skipped, %d trashed, %d folder(s) pruned, %d backup(s) archived%s\n",
                         report.moved, report.kept, report.skipped, report.trashed, report.pruned,
                         report.archived_folders, completed(report.status) ? "" : " (cancelled)");
            if (args.mode == Mode::StrongSort && completed(report.status)) {
                ImageReview review(classifier, trash, core_logger);
                const ReviewReport images = review.run(root, decisions);
                std::fprintf(stdout, "%d image(s) reviewed: %d trashed, %d moved to memes, %d renamed, %d redated, %d skipped%s\n",
                             images.reviewed, images.trashed, images.moved, images.renamed, images.redated, images.skipped,
                             completed(images.status) ? "" : " (cancelled)");
            }
            break;
        }
    }
    return EXIT_SUCCESS;
}

} // namespace


int main(int argc, char **argv) {
    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }

    try {
        return run_application(argc, argv);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("{}", ex.get_full_details());
        } else {
            std::fprintf(stderr, "%s\n", ex.get_full_details().c_str());
        }
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
