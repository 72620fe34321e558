#pragma once
#include <filesystem>
#include <string>

#include "BlobSource.hpp"

// a blob spooled as hex text, e.g. by "select data from DR$FOOINDEX$R" in SQL*Plus
// whitespace and line breaks are ignored, an optional leading "0x" is skipped
class HexTextBlobSource : public BlobSource {
    public:
    explicit HexTextBlobSource(const std::filesystem::path& fname);

    // for tests
    static HexTextBlobSource from_string(const std::string& text);

    size_t size() const override { return m_digits.size() / 2; }

    // throws MalformedRecord on a non-hex digit inside the requested range
    size_t read_at(off_t offset, void* buf, size_t count) override;
    using BlobSource::read_at;

    private:
    HexTextBlobSource() = default;
    void load(const std::string& text);

    std::string m_digits;
};
