#pragma once
#include <optional>
#include <string>

namespace mcpmail::utils {

    // Standard alphabet with padding, no line breaks
    std::string base64_encode(const std::string &data);

    /**
     * @brief Strict decoder. Whitespace is ignored; anything else outside the
     * alphabet, or a bad length/padding, yields nullopt.
     */
    std::optional<std::string> base64_decode(const std::string &encoded);

    // base64 split into CRLF-terminated lines of at most 76 characters (MIME)
    std::string base64_encode_mime(const std::string &data);

}// namespace mcpmail::utils
