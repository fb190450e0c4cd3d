#pragma once

#include "mru/mru_list.hpp"

#include <expected>
#include <string>

class MruStore {
public:
    virtual ~MruStore() = default;
    // Never fails: missing or unreadable storage yields an empty list.
    virtual MruList load() = 0;
    virtual std::expected<void, std::string> save(const MruList& list) = 0;
};
