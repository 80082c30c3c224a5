#include "sql_splitter.hpp"
#include <cctype>
#include "lib.hpp"

namespace {

    bool ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
    bool ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$'; }

    // index one past the closing quote (or sql.size() when unterminated)
    size_t skip_quoted(const std::string& sql, size_t i, char quote, bool backslash_escapes) {
        const size_t n = sql.size();
        size_t j = i + 1;
        while (j < n) {
            if (backslash_escapes && sql[j] == '\\') { j += 2; continue; }
            if (sql[j] == quote) {
                if (j + 1 < n && sql[j + 1] == quote) { j += 2; continue; } // doubled quote
                return j + 1;
            }
            ++j;
        }
        return n;
    }

    size_t skip_block_comment(const std::string& sql, size_t i) {
        const size_t n = sql.size();
        int depth = 0;
        size_t j = i;
        while (j < n) {
            if (sql[j] == '/' && j + 1 < n && sql[j + 1] == '*') { ++depth; j += 2; continue; }
            if (sql[j] == '*' && j + 1 < n && sql[j + 1] == '/') {
                j += 2;
                if (--depth == 0) return j;
                continue;
            }
            ++j;
        }
        return n;
    }

    // $tag$ at i -> tag length, 0 if not a dollar quote opener
    size_t dollar_tag(const std::string& sql, size_t i) {
        if (i > 0 && ident_char(sql[i - 1])) return 0;
        const size_t n = sql.size();
        size_t j = i + 1;
        if (j < n && ident_start(sql[j])) {
            while (j < n && ident_char(sql[j]) && sql[j] != '$') ++j;
        }
        if (j < n && sql[j] == '$') return j - i + 1;
        return 0;
    }
}

std::vector<std::string> split_statements(const std::string& sql) {
    std::vector<std::string> out;
    std::string cur;
    bool has_code = false;

    auto flush = [&]() {
        if (has_code) out.push_back(trim(cur));
        cur.clear();
        has_code = false;
    };

    const size_t n = sql.size();
    size_t i = 0;
    while (i < n) {
        const char c = sql[i];
        size_t end = i + 1;

        if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
            end = sql.find('\n', i);
            if (end == std::string::npos) end = n;
            cur.append(sql, i, end - i);
            i = end;
            continue;
        }
        if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
            end = skip_block_comment(sql, i);
            cur.append(sql, i, end - i);
            i = end;
            continue;
        }

        if (c == '\'') {
            bool escaped = i > 0 && (sql[i - 1] == 'E' || sql[i - 1] == 'e') && (i < 2 || !ident_char(sql[i - 2]));
            end = skip_quoted(sql, i, '\'', escaped);
        } else if (c == '"') {
            end = skip_quoted(sql, i, '"', false);
        } else if (c == '$') {
            size_t len = dollar_tag(sql, i);
            if (len > 0) {
                const std::string tag = sql.substr(i, len);
                size_t close = sql.find(tag, i + len);
                end = close == std::string::npos ? n : close + len;
            }
        } else if (c == ';') {
            cur += c;
            flush();
            ++i;
            continue;
        }

        cur.append(sql, i, end - i);
        if (!std::isspace(static_cast<unsigned char>(c))) has_code = true;
        i = end;
    }
    flush();
    return out;
}
