#pragma once
#include <cstdint>
#include "Rowid.hpp"

// layout of the DR$<index>$R table: row N holds the rowids of docids 35000*N+1 .. 35000*(N+1)
namespace Oracle::RTable {

constexpr uint64_t DOCIDS_PER_ROW = 35000;
constexpr size_t   MAX_ROW_BLOB   = DOCIDS_PER_ROW * Rowid::RAW_SIZE;

// 100 records per read
constexpr size_t CHUNK_SIZE = 1400;
static_assert(CHUNK_SIZE % Rowid::RAW_SIZE == 0);

constexpr uint64_t first_docid(uint64_t row_no) {
    return DOCIDS_PER_ROW * row_no + 1;
}

}
