#include "QtTrashBin.hpp"
#include "Utils.hpp"

#include <QFile>
#include <QFileInfo>
#include <QString>


bool QtTrashBin::move_to_trash(const std::filesystem::path& path, std::string* error)
{
    const QString qt_path = QString::fromStdString(Utils::path_to_utf8(path));
    if (!QFileInfo::exists(qt_path)) {
        if (error) {
            *error = "Source not found";
        }
        return false;
    }

    QFile file(qt_path);
    if (file.moveToTrash()) {
        return true;
    }

    if (error) {
        const QString reason = file.errorString();
        *error = reason.isEmpty() ? std::string("Failed to move to trash") : reason.toStdString();
    }
    return false;
}
