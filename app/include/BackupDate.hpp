#ifndef BACKUP_DATE_HPP
#define BACKUP_DATE_HPP

#include "Types.hpp"

#include <filesystem>
#include <optional>
#include <string>

class MediaClassifier;

namespace BackupDates {

/**
 * @brief True when @p name has the shape of a backup folder name.
 *
 * Accepted forms, with '-' or '_' as separator: MM-DD-YY, MM-DD-YYYY, YYYY-MM-DD,
 * YYYY-MM and MM-YYYY (month and day take one or two digits).
 */
bool matches_backup_grammar(const std::string& name);

bool is_valid_date(int year, int month, int day);

/**
 * @brief Calendar date encoded in a backup folder name.
 *
 * Two-digit years map to the 2000s; month-precision names yield day 1.
 * Returns nullopt for names outside the grammar or with impossible dates.
 */
std::optional<BackupDate> parse_backup_date(const std::string& name);

/**
 * @brief Date a backup folder should be filed under.
 *
 * Day-precision names are trusted as-is. Month-precision names are refined by a
 * majority vote over the local dates of the folder's direct media children that fall
 * in the named month; without a strict majority the result is unresolved.
 */
BackupInference infer_backup_date(const std::filesystem::path& folder,
                                  const MediaClassifier& classifier);

}

#endif
