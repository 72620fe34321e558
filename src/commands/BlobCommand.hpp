#pragma once
#include "Command.hpp"
#include "io/BlobSource.hpp"

#include <memory>

// base for commands reading a $R blob: blob pathname, --hex, --row/--base, --chunk-size
class BlobCommand : public Command {
    protected:
    BlobCommand(bool reg, const char* name, const char* description);

    // FileBlobSource or HexTextBlobSource, depending on --hex
    std::unique_ptr<BlobSource> open_source();

    // docid of the first record of the blob
    uint64_t base_docid();

    size_t chunk_size();
};
