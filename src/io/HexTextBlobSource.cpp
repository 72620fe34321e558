/**
 * @file HexTextBlobSource.cpp
 * @brief Blob source over a hex text dump of the blob.
 *
 * Digits are kept as text and converted on every read, so a bad digit is
 * reported only when the scan reaches it and all the records before it are
 * still decoded.
 */

#include "HexTextBlobSource.hpp"
#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/hex.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

HexTextBlobSource::HexTextBlobSource(const std::filesystem::path& fname) {
    std::ifstream f(fname, std::ios::binary);
    if (!f) {
        throw SourceReadFailure(0, fmt::format("cannot open \"{}\": {}", fname, strerror(errno)));
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        throw SourceReadFailure(0, fmt::format("cannot read \"{}\"", fname));
    }
    load(ss.str());
    logger->debug("{}: {} hex digits => {:#x} bytes", fname, m_digits.size(), size());
}

HexTextBlobSource HexTextBlobSource::from_string(const std::string& text) {
    HexTextBlobSource src;
    src.load(text);
    return src;
}

/**
 * @brief Strips whitespace and the optional "0x" prefix, keeps the rest as is.
 * @param text Raw file contents.
 * @throws MalformedRecord On an odd number of digits.
 */
void HexTextBlobSource::load(const std::string& text) {
    m_digits.clear();
    m_digits.reserve(text.size());
    for (char c : text) {
        if (!isspace((unsigned char)c)) {
            m_digits += c;
        }
    }

    if (m_digits.size() >= 2 && m_digits[0] == '0' && (m_digits[1] | 0x20) == 'x') {
        m_digits.erase(0, 2);
    }

    if (m_digits.size() % 2) {
        throw MalformedRecord(m_digits.size() / 2, fmt::format("odd number of hex digits: {}", m_digits.size()));
    }
}

size_t HexTextBlobSource::read_at(off_t offset, void* buf, size_t count) {
    if( offset < 0 ){
        throw std::invalid_argument(fmt::format("offset < 0: {:#x}", offset));
    }
    if( (size_t)offset >= size() ){
        return 0;
    }
    count = std::min(count, size() - offset);

    buf_t bytes;
    size_t bad_pos = 0;
    if (!from_hex(std::string_view(m_digits).substr(offset * 2, count * 2), bytes, &bad_pos)) {
        const size_t digit_pos = offset * 2 + bad_pos;
        throw MalformedRecord(digit_pos / 2, fmt::format("non-hex digit '{}' at digit {}", filter_unprintable(std::string(1, m_digits[digit_pos])), digit_pos));
    }
    memcpy(buf, bytes.data(), count);
    return count;
}
