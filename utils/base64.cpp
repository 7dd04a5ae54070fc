#include "base64.h"
#include <cctype>
#include <openssl/evp.h>
#include <vector>

namespace mcpmail::utils {

    std::string base64_encode(const std::string &data) {
        if (data.empty()) {
            return "";
        }
        std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
        int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char *>(data.data()),
                                      static_cast<int>(data.size()));
        return std::string(reinterpret_cast<const char *>(out.data()), static_cast<size_t>(written));
    }

    std::optional<std::string> base64_decode(const std::string &encoded) {
        std::string compact;
        compact.reserve(encoded.size());
        for (char c: encoded) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                compact.push_back(c);
            }
        }
        if (compact.empty()) {
            return std::string();
        }
        if (compact.size() % 4 != 0) {
            return std::nullopt;
        }

        size_t padding = 0;
        if (compact.back() == '=') {
            padding = compact[compact.size() - 2] == '=' ? 2 : 1;
        }
        // '=' is only legal as trailing padding
        if (compact.find('=') < compact.size() - padding) {
            return std::nullopt;
        }

        std::vector<unsigned char> out(3 * compact.size() / 4 + 1);
        int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char *>(compact.data()),
                                      static_cast<int>(compact.size()));
        if (written < 0) {
            return std::nullopt;
        }
        // EVP_DecodeBlock counts padding as zero bytes
        return std::string(reinterpret_cast<const char *>(out.data()), static_cast<size_t>(written) - padding);
    }

    std::string base64_encode_mime(const std::string &data) {
        const std::string encoded = base64_encode(data);
        std::string out;
        out.reserve(encoded.size() + encoded.size() / 76 * 2 + 2);
        for (size_t pos = 0; pos < encoded.size(); pos += 76) {
            out.append(encoded, pos, 76);
            out.append("\r\n");
        }
        return out;
    }

}// namespace mcpmail::utils
