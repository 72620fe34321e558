#pragma once
#include <cstdint>
#include <string>
#include <sys/types.h>

#include "Oracle/Rowid.hpp"

// one decoded $R entry
struct Record {
    uint64_t docid = 0;            // ordinal
    off_t offset = 0;              // of the raw record in the blob
    Oracle::Rowid::raw_t raw{};
    std::string rowid;
};
