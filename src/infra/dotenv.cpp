#include "xdgbase/infra/dotenv.hpp"
#include "xdgbase/core/logger.hpp"

#include <fstream>
#include <string>
#include <string_view>

namespace xdgbase::infra {

namespace {

auto trim(std::string_view s) -> std::string_view {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

auto parse_quoted_value(std::string_view line, char quote_char) -> std::string {
    std::string value;
    std::size_t pos = 0;

    while (pos < line.size()) {
        char c = line[pos];

        if (c == quote_char) {
            return value;
        }

        if (c == '\\' && quote_char == '"' && pos + 1 < line.size()) {
            ++pos;
            char next = line[pos];
            switch (next) {
                case 'n':  value += '\n'; break;
                case 'r':  value += '\r'; break;
                case 't':  value += '\t'; break;
                case '\\': value += '\\'; break;
                case '"':  value += '"';  break;
                default:
                    value += '\\';
                    value += next;
                    break;
            }
        } else {
            value += c;
        }
        ++pos;
    }

    // Unterminated quote - keep what we have
    return value;
}

auto parse_unquoted_value(std::string_view raw) -> std::string {
    auto str = std::string(raw);
    auto comment_pos = str.find(" #");
    if (comment_pos != std::string::npos) {
        str = str.substr(0, comment_pos);
    }
    auto end = str.find_last_not_of(" \t");
    if (end != std::string::npos) {
        str = str.substr(0, end + 1);
    }
    return str;
}

} // anonymous namespace

auto parse(const std::filesystem::path& path) -> Result<Environment::Variables> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Could not open .env file", path.string()));
    }

    Environment::Variables variables;
    std::string raw_line;
    int line_number = 0;

    while (std::getline(file, raw_line)) {
        ++line_number;

        auto line = trim(raw_line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        if (line.starts_with("export ")) {
            line = trim(line.substr(7));
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos) {
            LOG_WARN("{}:{}: Skipping malformed line (no '=')", path.string(), line_number);
            continue;
        }

        auto key = std::string(trim(line.substr(0, eq_pos)));
        if (key.empty()) {
            LOG_WARN("{}:{}: Skipping line with empty key", path.string(), line_number);
            continue;
        }

        auto value_trimmed = trim(line.substr(eq_pos + 1));

        std::string value;
        if (!value_trimmed.empty() &&
            (value_trimmed.front() == '"' || value_trimmed.front() == '\'')) {
            value = parse_quoted_value(value_trimmed.substr(1), value_trimmed.front());
        } else {
            value = parse_unquoted_value(value_trimmed);
        }

        variables.insert_or_assign(std::move(key), std::move(value));
    }

    LOG_DEBUG("Parsed {} variables from {}", variables.size(), path.string());
    return variables;
}

auto load(const std::filesystem::path& path, const Environment& base, bool overwrite)
    -> Result<Environment> {
    auto variables = parse(path);
    if (!variables) {
        return std::unexpected(std::move(variables.error()));
    }

    LOG_DEBUG("Loaded .env from {} ({})", path.string(),
              overwrite ? "overwriting" : "keeping existing variables");
    return base.overlay(*variables, overwrite);
}

} // namespace xdgbase::infra
