#pragma once

#include <map>
#include <string>
#include <string_view>

namespace curlhttp {

    /** @brief Form fields; keys sorted, repeated keys allowed. */
    using FormValues = std::multimap<std::string, std::string>;

    namespace url_utils {

        /// @brief Percent-encode @p s for application/x-www-form-urlencoded
        /// (unreserved bytes kept, space becomes '+').
        inline std::string query_escape(std::string_view s) {
            static constexpr char kHex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(s.size());
            for (unsigned char c : s) {
                const bool unreserved = (c >= 'A' && c <= 'Z') ||
                                        (c >= 'a' && c <= 'z') ||
                                        (c >= '0' && c <= '9') || c == '-' ||
                                        c == '_' || c == '.' || c == '~';
                if (unreserved) {
                    out.push_back(static_cast<char>(c));
                } else if (c == ' ') {
                    out.push_back('+');
                } else {
                    out.push_back('%');
                    out.push_back(kHex[c >> 4]);
                    out.push_back(kHex[c & 0x0F]);
                }
            }
            return out;
        }

        /// @brief Encode form values as "a=1&b=2", ordered by key.
        inline std::string form_encode(const FormValues& values) {
            std::string out;
            for (const auto& [key, value] : values) {
                if (!out.empty()) out.push_back('&');
                out += query_escape(key);
                out.push_back('=');
                out += query_escape(value);
            }
            return out;
        }

    }  // namespace url_utils

}  // namespace curlhttp
