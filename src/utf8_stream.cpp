#include "utf8_stream.h"

namespace coderun {

namespace {

const char REPLACEMENT[] = "\xEF\xBF\xBD";

// Continuation bytes after the lead byte, and the allowed range of the
// first one (RFC 3629 table). Returns false for a byte that cannot start
// a sequence.
bool classify_lead(unsigned char c, size_t& trailing, unsigned char& lo, unsigned char& hi) {
    lo = 0x80;
    hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        trailing = 1;
    } else if (c == 0xE0) {
        trailing = 2;
        lo = 0xA0;
    } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
        trailing = 2;
    } else if (c == 0xED) {
        trailing = 2;
        hi = 0x9F;                  // No surrogates
    } else if (c == 0xF0) {
        trailing = 3;
        lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
        trailing = 3;
    } else if (c == 0xF4) {
        trailing = 3;
        hi = 0x8F;                  // Nothing above U+10FFFF
    } else {
        return false;
    }
    return true;
}

} // namespace

std::string Utf8Assembler::feed(const std::string& bytes) {
    std::string input = pending_ + bytes;
    pending_.clear();

    std::string out;
    out.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            i++;
            continue;
        }

        size_t trailing = 0;
        unsigned char lo = 0, hi = 0;
        if (!classify_lead(c, trailing, lo, hi)) {
            out += REPLACEMENT;
            i++;
            continue;
        }

        size_t j = 1;
        bool invalid = false;
        for (; j <= trailing && i + j < input.size(); j++) {
            unsigned char next = static_cast<unsigned char>(input[i + j]);
            unsigned char min = (j == 1) ? lo : 0x80;
            unsigned char max = (j == 1) ? hi : 0xBF;
            if (next < min || next > max) {
                invalid = true;
                break;
            }
        }

        if (invalid) {
            out += REPLACEMENT;
            i += j;
        } else if (j <= trailing) {
            // Ran out of input mid-sequence
            pending_ = input.substr(i);
            break;
        } else {
            out.append(input, i, trailing + 1);
            i += trailing + 1;
        }
    }
    return out;
}

std::string Utf8Assembler::flush() {
    if (pending_.empty()) return "";
    pending_.clear();
    return REPLACEMENT;
}

std::string Utf8Assembler::sanitize(const std::string& bytes) {
    Utf8Assembler assembler;
    std::string out = assembler.feed(bytes);
    out += assembler.flush();
    return out;
}

} // namespace coderun
