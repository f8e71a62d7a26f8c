#include "utils/encoding.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace agentbox::utils {

std::string Base64Encode(const std::string& data) {
    if (data.empty()) {
        return {};
    }
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
}

std::string Base64Decode(const std::string& encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    for (char c : encoded) {
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t') {
            compact += c;
        }
    }
    if (compact.empty()) {
        return {};
    }
    if (compact.size() % 4 != 0) {
        throw std::invalid_argument("invalid base64 length");
    }
    std::vector<unsigned char> out(compact.size() / 4 * 3 + 1);
    const int written = EVP_DecodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(compact.data()),
        static_cast<int>(compact.size()));
    if (written < 0) {
        throw std::invalid_argument("invalid base64 data");
    }
    // EVP_DecodeBlock counts the padding bytes as decoded zeros.
    std::size_t padding = 0;
    if (compact.back() == '=') {
        ++padding;
        if (compact[compact.size() - 2] == '=') {
            ++padding;
        }
    }
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<std::size_t>(written) - padding);
}

bool IsValidUtf8(const std::string& data) {
    std::size_t i = 0;
    const auto size = data.size();
    while (i < size) {
        const auto c = static_cast<unsigned char>(data[i]);
        std::size_t extra = 0;
        unsigned int codepoint = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            codepoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            codepoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            codepoint = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= size) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(data[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            codepoint = (codepoint << 6) | (cc & 0x3F);
        }
        // Overlong encodings, surrogates and out-of-range values.
        if ((extra == 1 && codepoint < 0x80) ||
            (extra == 2 && codepoint < 0x800) ||
            (extra == 3 && (codepoint < 0x10000 || codepoint > 0x10FFFF)) ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string RandomHex(std::size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : buffer) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::string UrlEncodePath(const std::string& path) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out << static_cast<char>(c);
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

}  // namespace agentbox::utils
