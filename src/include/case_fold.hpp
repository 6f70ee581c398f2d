#ifndef CASEPATH_CASE_FOLD_HPP
#define CASEPATH_CASE_FOLD_HPP

#include "common.hpp"

namespace CaseFold
{
    // true if the bytes form well-formed UTF-8
    [[nodiscard]] bool isValidUtf8(std::string_view text);

    // lowercase a UTF-8 string, std::nullopt when it is not valid UTF-8.
    // Each code point maps to exactly one code point (the locale's simple
    // mapping): U+0130 becomes 'i' rather than "i\u0307", and a final sigma
    // is not special-cased. Requests and directory entries go through the
    // same mapping, so matching stays symmetric.
    [[nodiscard]] std::optional<std::string> toLower(std::string_view text);

    // cache key for a path: its lowercased text, or the path unchanged
    // when it is not valid UTF-8
    [[nodiscard]] std::string foldPath(const fs::path &path);
}

#endif // CASEPATH_CASE_FOLD_HPP
