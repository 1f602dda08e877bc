#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <boost/json.hpp>

#include "key_types.hpp"

namespace keydir {

// Malformed client input: bad JSON shape, bad base64, wrong key length.
// Always raised before anything is written.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// Decoded body of POST /v1/keys/upload. The user id comes from the gateway.
struct KeyUpload {
    std::string user_id;
    Bytes identity_key;
    SignedPreKey signed_pre_key;
    std::vector<OneTimePreKey> one_time_pre_keys;
};

// Decoded body of POST /v1/keys/rotate.
struct KeyRotation {
    std::string user_id;
    SignedPreKey signed_pre_key;
    std::vector<OneTimePreKey> one_time_pre_keys;
};

// Wire translation between the JSON/base64 HTTP format and the domain types.
namespace codec {

std::string encode_base64(const Bytes& data);

// Strict standard-alphabet base64 with padding. Throws ValidationError.
Bytes decode_base64(std::string_view encoded);

KeyUpload parse_upload(const boost::json::value& body, const std::string& user_id);
KeyRotation parse_rotation(const boost::json::value& body, const std::string& user_id);

boost::json::object bundle_to_json(const PreKeyBundle& bundle);

} // namespace codec

} // namespace keydir
