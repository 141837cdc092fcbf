#include "curlhttp/sinks.hpp"

#include <cctype>
#include <utility>

namespace curlhttp {

    namespace {

        std::string_view trim(std::string_view s) {
            while (!s.empty() &&
                   std::isspace(static_cast<unsigned char>(s.front())))
                s.remove_prefix(1);
            while (!s.empty() &&
                   std::isspace(static_cast<unsigned char>(s.back())))
                s.remove_suffix(1);
            return s;
        }

        bool is_status_line(std::string_view line) {
            return line.rfind("HTTP/", 0) == 0;
        }

        // Position and length of the first blank line; npos when absent.
        std::pair<std::size_t, std::size_t> find_blank_line(
            std::string_view s) {
            auto pos = s.find("\r\n\r\n");
            if (pos != std::string_view::npos) return {pos, 4};
            pos = s.find("\n\n");
            return {pos, 2};
        }

        bool is_token_char(unsigned char c) {
            if (std::isalnum(c)) return true;
            switch (c) {
                case '!':
                case '#':
                case '$':
                case '%':
                case '&':
                case '\'':
                case '*':
                case '+':
                case '-':
                case '.':
                case '^':
                case '_':
                case '`':
                case '|':
                case '~':
                    return true;
                default:
                    return false;
            }
        }

    }  // namespace

    void ResponseBuffer::append(std::string_view bytes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_bytes.append(bytes.data(), bytes.size());
    }

    std::string ResponseBuffer::bytes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_bytes;
    }

    std::size_t ResponseBuffer::size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_bytes.size();
    }

    void ResponseBuffer::clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_bytes.clear();
    }

    void HeaderCollector::add_header_line(std::string_view line) {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Interim (1xx), redirect and proxy responses each start a new
        // block; only the last one describes the response.
        if (is_status_line(line)) {
            m_headers.clear();
            return;
        }
        curlhttp::add_header_line(m_headers, line);
    }

    http::fields HeaderCollector::headers() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_headers;
    }

    std::string canonical_header_key(std::string_view key) {
        std::string out(key);
        for (unsigned char c : out) {
            if (!is_token_char(c)) return out;
        }
        bool upper = true;
        for (char& c : out) {
            const auto uc = static_cast<unsigned char>(c);
            c = static_cast<char>(upper ? std::toupper(uc) : std::tolower(uc));
            upper = (c == '-');
        }
        return out;
    }

    bool add_header_line(http::fields& out, std::string_view line) {
        line = trim(line);
        if (line.empty()) return false;
        if (is_status_line(line)) return false;

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) return false;

        const auto name = trim(line.substr(0, colon));
        const auto value = trim(line.substr(colon + 1));
        if (name.empty()) return false;

        out.insert(canonical_header_key(name),
                   boost::beast::string_view(value.data(), value.size()));
        return true;
    }

    http::fields parse_headers(std::string_view block) {
        http::fields out;
        while (!block.empty()) {
            const auto nl = block.find('\n');
            add_header_line(out, block.substr(0, nl));
            if (nl == std::string_view::npos) break;
            block.remove_prefix(nl + 1);
        }
        return out;
    }

    Result<HeaderBlock> split_header_block(std::string_view combined) {
        auto [pos, sep_len] = find_blank_line(combined);
        if (pos == std::string_view::npos) {
            return Result<HeaderBlock>::err(
                Error{Error::Code::ParseFailed,
                      "failed to separate headers and body in response"});
        }
        std::string_view head = combined.substr(0, pos);
        std::string_view rest = combined.substr(pos + sep_len);

        // Skip to the last block when several responses were delivered.
        while (is_status_line(rest)) {
            const auto [next, next_len] = find_blank_line(rest);
            if (next == std::string_view::npos) break;
            head = rest.substr(0, next);
            rest = rest.substr(next + next_len);
        }
        return Result<HeaderBlock>::ok(HeaderBlock{head, rest});
    }

}  // namespace curlhttp
