#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <boost/json.hpp>

namespace keydir {

// Request-level input checks shared by the HTTP handlers.
class InputValidator {
public:
    // Caller and target ids: 1-64 chars of [A-Za-z0-9_-] (covers UUIDs).
    static bool is_valid_user_id(const std::string& id) {
        if (id.empty() || id.size() > 64) return false;
        return std::all_of(id.begin(), id.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
        });
    }

    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    /**
     * JSON parsing with a recursion depth limit to prevent stack exhaustion.
     * @throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(const std::string& input, size_t max_depth = 16) {
        boost::json::parse_options opt;
        opt.max_depth = max_depth;
        return boost::json::parse(input, {}, opt);
    }
};

} // namespace keydir
