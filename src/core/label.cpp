/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file label.cpp
 * @brief Type-name demangling and shortening behind the default label.
 */

#include "tagid/core/label.hpp"

#include <cstdlib>
#include <cxxabi.h>
#include <memory>
#include <vector>

namespace tagid::detail {

std::string demangle(const char* mangled)
{
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> result(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status != 0 || !result) {
        return mangled;
    }
    return result.get();
}

/**
 * @brief Single pass over the demangled text.
 *
 * `segment_start` marks where the current (possibly qualified) name began in the
 * output. On `::` everything since then is discarded. Template brackets push and
 * pop that marker, so `Box<Order>::Inner` shortens to `Inner`, while parentheses
 * (function scopes of local classes) are kept inside the segment and discarded
 * along with it.
 */
std::string short_type_name(std::string_view demangled)
{
    std::string text(demangled);
    const std::string anon = "(anonymous namespace)::";
    for (size_t pos = text.find(anon); pos != std::string::npos; pos = text.find(anon, pos)) {
        text.erase(pos, anon.size());
    }

    std::string out;
    out.reserve(text.size());
    std::vector<size_t> outer;
    size_t segment_start = 0;
    int parens = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (parens > 0) {
            out.push_back(c);
            if (c == '(') {
                ++parens;
            } else if (c == ')') {
                --parens;
            }
            continue;
        }

        if (c == ':' && i + 1 < text.size() && text[i + 1] == ':') {
            out.resize(segment_start);
            ++i;
            continue;
        }

        switch (c) {
        case '(':
            ++parens;
            out.push_back(c);
            break;
        case '<':
            out.push_back(c);
            outer.push_back(segment_start);
            segment_start = out.size();
            break;
        case '>':
            out.push_back(c);
            if (!outer.empty()) {
                segment_start = outer.back();
                outer.pop_back();
            }
            break;
        case ',':
        case ' ':
        case '*':
        case '&':
            out.push_back(c);
            segment_start = out.size();
            break;
        default:
            out.push_back(c);
            break;
        }
    }

    std::string compact;
    compact.reserve(out.size());
    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i] == ' ') {
            const bool after_comma = !compact.empty() && compact.back() == ',';
            const bool before_close = i + 1 < out.size() && out[i + 1] == '>';
            if (after_comma || before_close) {
                continue;
            }
        }
        compact.push_back(out[i]);
    }
    return compact;
}

} // namespace tagid::detail
