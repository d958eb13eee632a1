#pragma once

#include <string>

namespace coderun {

// Turns an arbitrary byte stream into well-formed UTF-8. A sequence cut
// off at the end of one feed() is held back and completed by the next.
// Ill-formed bytes become U+FFFD, one per maximal invalid subpart.
class Utf8Assembler {
public:
    std::string feed(const std::string& bytes);

    // Emits U+FFFD for a held-back incomplete sequence, if any
    std::string flush();

    bool has_pending() const { return !pending_.empty(); }

    // One-shot conversion of a complete buffer
    static std::string sanitize(const std::string& bytes);

private:
    std::string pending_;
};

} // namespace coderun
