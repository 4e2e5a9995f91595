#include <algorithm>
#include <solranklib/config_file.hh>
#include <solranklib/file_contents.hh>

using std::string;

namespace {

constexpr bool is_print(char c) noexcept {
    return static_cast<unsigned char>(c) >= 32 and static_cast<unsigned char>(c) < 127;
}

constexpr bool is_name_char(char c) noexcept {
    return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
        c == '-' or c == '_' or c == '.';
}

// Whitespace but not a newline
constexpr bool is_ws(char c) noexcept { return c != '\n' and is_space(c); }

} // namespace

void ConfigFile::load_config_from_file(const string& pathname, bool load_all) {
    load_config_from_string(get_file_contents(pathname), load_all);
}

void ConfigFile::load_config_from_string(string config, bool load_all) {
    // Set all variables as unset
    for (auto& [name, var] : vars) {
        var.unset();
    }

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0;
    // config[pos + k] is safe as long as we do not cross the final newline
    auto at = [&](size_t k = 0) { return config[pos + k]; };
    auto skip_while = [&](auto&& pred) {
        while (pos < config.size() and pred(config[pos])) {
            ++pos;
        }
    };

    auto throw_parse_error = [&](auto&&... args) {
        size_t err_pos = std::min(pos, config.size() - 1);
        size_t line_beg = config.rfind('\n', err_pos == 0 ? 0 : err_pos - 1);
        line_beg = (line_beg == string::npos or err_pos == 0 ? 0 : line_beg + 1);
        auto line = 1 + std::count(config.begin(), config.begin() + line_beg, '\n');
        size_t col = err_pos - line_beg + 1; // Indexed from 1

        ParseError pe(line, col, std::forward<decltype(args)>(args)...);

        // Construct diagnostics
        auto& diags = pe.diagnostics_;
        auto append_char = [&](char c) {
            if (is_print(c)) {
                diags += c;
            } else {
                diags += "\\x";
                diags += dec2hex(static_cast<unsigned char>(c) >> 4);
                diags += dec2hex(static_cast<unsigned char>(c) & 15);
            }
        };

        constexpr size_t CONTEXT = 32;
        size_t ctx_beg = line_beg;
        if (err_pos - line_beg > CONTEXT) {
            diags += "...";
            ctx_beg = err_pos - CONTEXT;
        }
        for (size_t k = ctx_beg; k < err_pos; ++k) {
            append_char(config[k]);
        }

        size_t padding = diags.size();
        size_t stress_len = 1;
        if (config[err_pos] != '\n') {
            append_char(config[err_pos]);
            stress_len = diags.size() - padding;

            size_t k = err_pos + 1;
            for (; config[k] != '\n' and k <= err_pos + CONTEXT; ++k) {
                append_char(config[k]);
            }
            if (config[k] != '\n') {
                diags += "...";
            }
        }

        diags += '\n';
        diags.append(padding, ' ');
        diags += '^';
        diags.append(stress_len - 1, '~');
        throw std::move(pe);
    };

    auto extract_value = [&](bool is_in_array) {
        string res;
        // Single-quoted string ('' stands for ')
        if (at() == '\'') {
            for (++pos; at() != '\n'; ++pos) {
                if (at() == '\'') {
                    if (at(1) != '\'') {
                        ++pos;
                        return res;
                    }
                    ++pos;
                }
                res += at();
            }
            throw_parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (at() == '"') {
            for (++pos; at() != '\n'; ++pos) {
                if (at() == '"') {
                    ++pos;
                    return res;
                }
                if (at() != '\\') {
                    res += at();
                    continue;
                }

                // Escape sequence
                ++pos;
                switch (at()) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '?': res += '?'; continue;
                case '\\': res += '\\'; continue;
                case 't': res += '\t'; continue;
                case 'a': res += '\a'; continue;
                case 'b': res += '\b'; continue;
                case 'f': res += '\f'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                case 'v': res += '\v'; continue;
                case 'x':
                    // The final newline guards the buffer end
                    for (int i = 0; i < 2; ++i) {
                        ++pos;
                        if (not is_xdigit(at())) {
                            throw_parse_error("Invalid hexadecimal digit: `", at(), '`');
                        }
                    }
                    res += static_cast<char>((hex2dec(config[pos - 1]) << 4) + hex2dec(at()));
                    continue;
                default: throw_parse_error("Unknown escape sequence: `\\", at(), '`');
                }
            }
            throw_parse_error("Missing terminating \" character");
        }

        // String literal
        if (at() == '[' or (is_in_array and (at() == ',' or at() == ']'))) {
            throw_parse_error("Invalid beginning of the string literal: `", at(), '`');
        }

        size_t beg = pos;
        auto is_end = [&](char c) {
            return c == '\n' or c == '#' or (is_in_array and (c == ']' or c == ','));
        };
        while (not is_end(at(1))) {
            ++pos;
        }
        // Remove white-spaces from ending
        size_t end = pos + 1;
        while (end > beg and is_space(config[end - 1])) {
            --end;
        }
        res = config.substr(beg, end - beg);
        pos = end;
        return res;
    };

    auto skip_comment = [&] { skip_while([](char c) { return c != '\n'; }); };

    Variable ignored; // Used for variables not in the variable set
    while (pos < config.size()) {
        skip_while(is_ws);
        if (at() == '\n') {
            ++pos;
            continue;
        }
        if (at() == '#') {
            skip_comment();
            ++pos;
            continue;
        }

        /* Variable name */
        size_t name_beg = pos;
        skip_while(is_name_char);
        string name = config.substr(name_beg, pos - name_beg);
        if (name.empty()) {
            throw_parse_error("Invalid or missing variable's name");
        }

        /* Assignment operator */
        skip_while(is_ws);
        if (at() == '\n' or at() == '#') {
            throw_parse_error("Incomplete directive: `", name, '`');
        }
        if (at() != '=' and at() != ':') {
            throw_parse_error("Invalid assignment operator: `", at(), '`');
        }
        ++pos;
        skip_while(is_ws);

        /* Value */
        Variable* varp = nullptr;
        if (load_all) {
            varp = &vars[name];
        } else {
            auto it = vars.find(name);
            varp = (it != vars.end() ? &it->second : &ignored);
        }
        Variable& var = *varp;
        var.unset();
        var.flag_ = Variable::SET;

        if (at() != '[') {
            if (at() != '\n' and at() != '#') {
                var.str_ = extract_value(false);
            }
        } else { // Array
            var.flag_ |= Variable::ARRAY;
            ++pos; // Skip [
            for (;;) {
                skip_while(is_space);
                if (pos >= config.size()) {
                    throw_parse_error("Missing terminating ] character at the end of an array");
                }
                if (at() == ']') {
                    ++pos;
                    break;
                }
                if (at() == '#') {
                    skip_comment();
                    continue;
                }
                // Ignore extra delimiters
                if (at() == ',') {
                    ++pos;
                    continue;
                }

                var.arr_.emplace_back(extract_value(true));

                skip_while(is_ws);
                if (at() == ',' or at() == '\n') {
                    ++pos;
                    continue;
                }
                if (at() == '#') {
                    skip_comment();
                    continue;
                }
                if (at() == ']') {
                    ++pos;
                    break;
                }

                throw_parse_error("Unknown sequence after the value: `", at(), '`');
            }
        }

        /* After the value */
        skip_while(is_ws);
        if (at() == '#') {
            skip_comment();
        }
        if (at() != '\n') {
            throw_parse_error("Unknown sequence after the value: `", at(), '`');
        }
        ++pos; // Newline
    }
}
