#include "infrastructure/StoreRouting.hpp"
#include <cctype>
#include <cstdio>

namespace pixelorigin::infrastructure {

namespace {

std::string PercentEncode(const std::string& value, bool keepSlash) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keepSlash && c == '/')) {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // namespace

std::string StoreRouting::MrapAlias(const std::string& mrapArn) {
    auto slash = mrapArn.rfind('/');
    return slash == std::string::npos ? mrapArn : mrapArn.substr(slash + 1);
}

std::string StoreRouting::MrapEndpoint(const std::string& mrapArn) {
    return "https://" + MrapAlias(mrapArn) + ".accesspoint.s3-global.amazonaws.com";
}

std::string StoreRouting::RegionalEndpoint(const std::string& awsRegion) {
    return "https://s3." + awsRegion + ".amazonaws.com";
}

std::string StoreRouting::EncodeKey(const std::string& key) {
    return PercentEncode(key, true);
}

std::string StoreRouting::EncodeComponent(const std::string& value) {
    return PercentEncode(value, false);
}

std::string StoreRouting::EncodeHeaderValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (c >= 0x20 && c < 0x7F && c != '%') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // namespace pixelorigin::infrastructure
