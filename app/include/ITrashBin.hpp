#pragma once

#include <filesystem>
#include <string>

class ITrashBin {
public:
    virtual ~ITrashBin() = default;
    /// Moves @p path to a recoverable trash; fills @p error on failure.
    virtual bool move_to_trash(const std::filesystem::path& path, std::string* error) = 0;
};
