#include "key_codec.hpp"
#include <boost/beast/core/detail/base64.hpp>
#include <limits>

namespace keydir {
namespace codec {

namespace base64 = boost::beast::detail::base64;
namespace json = boost::json;

std::string encode_base64(const Bytes& data) {
    std::string out;
    out.resize(base64::encoded_size(data.size()));
    out.resize(base64::encode(out.data(), data.data(), data.size()));
    return out;
}

Bytes decode_base64(std::string_view encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        throw ValidationError("base64 length must be a non-zero multiple of 4");
    }

    Bytes out(base64::decoded_size(encoded.size()));
    auto result = base64::decode(out.data(), encoded.data(), encoded.size());

    // Anything after the decoded prefix must be at most two '=' characters.
    std::size_t rest = encoded.size() - result.second;
    if (rest > 2 || encoded.find_first_not_of('=', result.second) != std::string_view::npos) {
        throw ValidationError("invalid base64 encoding");
    }
    out.resize(result.first);
    return out;
}

namespace {

const json::object& require_object(const json::value& v, const char* field) {
    if (!v.is_object()) throw ValidationError(std::string(field) + " must be an object");
    return v.as_object();
}

const json::value& require_field(const json::object& obj, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end()) throw ValidationError(std::string("missing field ") + field);
    return it->value();
}

Bytes require_key(const json::object& obj, const char* field, std::size_t expected_size) {
    const auto& v = require_field(obj, field);
    if (!v.is_string()) throw ValidationError(std::string(field) + " must be a base64 string");
    Bytes decoded = decode_base64(std::string_view(v.as_string().data(), v.as_string().size()));
    if (decoded.size() != expected_size) {
        throw ValidationError(std::string(field) + " must decode to " + std::to_string(expected_size) + " bytes");
    }
    return decoded;
}

std::uint32_t require_key_id(const json::object& obj) {
    const auto& v = require_field(obj, "key_id");
    std::int64_t id = 0;
    if (v.is_int64()) {
        id = v.as_int64();
    } else if (v.is_uint64() && v.as_uint64() <= std::numeric_limits<std::uint32_t>::max()) {
        id = static_cast<std::int64_t>(v.as_uint64());
    } else {
        throw ValidationError("key_id must be an integer");
    }
    if (id < 0 || id > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
        throw ValidationError("key_id out of range");
    }
    return static_cast<std::uint32_t>(id);
}

SignedPreKey parse_signed_pre_key(const json::value& v, const std::string& user_id) {
    const auto& obj = require_object(v, "signed_pre_key");
    SignedPreKey spk;
    spk.user_id = user_id;
    spk.key_id = require_key_id(obj);
    spk.public_key = require_key(obj, "public_key", kPreKeySize);
    spk.signature = require_key(obj, "signature", kSignatureSize);
    return spk;
}

std::vector<OneTimePreKey> parse_one_time_pre_keys(const json::value& v, const std::string& user_id) {
    if (!v.is_array()) throw ValidationError("one_time_pre_keys must be an array");
    std::vector<OneTimePreKey> keys;
    keys.reserve(v.as_array().size());
    for (const auto& item : v.as_array()) {
        const auto& obj = require_object(item, "one_time_pre_keys[]");
        OneTimePreKey otk;
        otk.user_id = user_id;
        otk.key_id = require_key_id(obj);
        otk.public_key = require_key(obj, "public_key", kPreKeySize);
        keys.push_back(std::move(otk));
    }
    return keys;
}

} // namespace

KeyUpload parse_upload(const json::value& body, const std::string& user_id) {
    const auto& obj = require_object(body, "request body");

    KeyUpload upload;
    upload.user_id = user_id;
    upload.identity_key = require_key(obj, "identity_key", kIdentityKeySize);
    upload.signed_pre_key = parse_signed_pre_key(require_field(obj, "signed_pre_key"), user_id);

    auto it = obj.find("one_time_pre_keys");
    if (it != obj.end() && !it->value().is_null()) {
        upload.one_time_pre_keys = parse_one_time_pre_keys(it->value(), user_id);
    }
    return upload;
}

KeyRotation parse_rotation(const json::value& body, const std::string& user_id) {
    const auto& obj = require_object(body, "request body");

    KeyRotation rotation;
    rotation.user_id = user_id;
    rotation.signed_pre_key = parse_signed_pre_key(require_field(obj, "signed_pre_key"), user_id);

    auto it = obj.find("one_time_pre_keys");
    if (it != obj.end() && !it->value().is_null()) {
        rotation.one_time_pre_keys = parse_one_time_pre_keys(it->value(), user_id);
    }
    return rotation;
}

json::object bundle_to_json(const PreKeyBundle& bundle) {
    json::object out;
    out["user_id"] = bundle.user_id;
    out["identity_key"] = encode_base64(bundle.identity_key.public_key);

    json::object spk;
    spk["key_id"] = bundle.signed_pre_key.key_id;
    spk["public_key"] = encode_base64(bundle.signed_pre_key.public_key);
    spk["signature"] = encode_base64(bundle.signed_pre_key.signature);
    out["signed_pre_key"] = std::move(spk);

    if (bundle.one_time_pre_key) {
        json::object otk;
        otk["key_id"] = bundle.one_time_pre_key->key_id;
        otk["public_key"] = encode_base64(bundle.one_time_pre_key->public_key);
        out["one_time_pre_key"] = std::move(otk);
    }
    return out;
}

} // namespace codec
} // namespace keydir
