#ifndef QT_TRASH_BIN_HPP
#define QT_TRASH_BIN_HPP

#include "ITrashBin.hpp"

/**
 * @brief Desktop trash through QFile::moveToTrash. Never falls back to deleting.
 */
class QtTrashBin : public ITrashBin {
public:
    bool move_to_trash(const std::filesystem::path& path, std::string* error) override;
};

#endif
